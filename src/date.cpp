#include "healthopt/date.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace healthopt {
namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int parse_digits(std::string_view s, size_t pos, size_t len) {
    int v = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isdigit(c)) {
            return -1;
        }
        v = v * 10 + (c - '0');
    }
    return v;
}

}  // namespace

int days_in_month(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::invalid_argument("days_in_month: month must be in [1,12]");
    }
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

Date parse_date(std::string_view s) {
    const std::string raw(s);
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') {
        throw std::runtime_error("invalid date (expected YYYY-MM-DD): " + raw);
    }
    if (s.size() > 10 && s[10] != 'T' && s[10] != ' ') {
        throw std::runtime_error("invalid date (expected YYYY-MM-DD): " + raw);
    }

    Date d;
    d.year = parse_digits(s, 0, 4);
    d.month = parse_digits(s, 5, 2);
    d.day = parse_digits(s, 8, 2);
    if (d.year < 0 || d.month < 1 || d.month > 12 || d.day < 1) {
        throw std::runtime_error("invalid date: " + raw);
    }
    if (d.day > days_in_month(d.year, d.month)) {
        throw std::runtime_error("invalid date (day out of range): " + raw);
    }
    return d;
}

std::string format_date(const Date& d) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << d.year << '-' << std::setw(2) << d.month << '-' << std::setw(2)
        << d.day;
    return oss.str();
}

}  // namespace healthopt
