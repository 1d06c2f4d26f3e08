#pragma once

#include <string>
#include <string_view>

namespace healthopt {

// Calendar day (no time-of-day, no time zone).
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool operator==(const Date& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) {
            return year < o.year;
        }
        if (month != o.month) {
            return month < o.month;
        }
        return day < o.day;
    }
};

int days_in_month(int year, int month);

// Accepts "YYYY-MM-DD" or an ISO-8601 timestamp ("YYYY-MM-DDThh:mm:ssZ"); the time part is dropped.
Date parse_date(std::string_view s);
std::string format_date(const Date& d);

}  // namespace healthopt
