#include "healthopt/entry_csv.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace healthopt {
namespace {

std::string trim_copy(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        const size_t pos = line.find(',', start);
        if (pos == std::string::npos) {
            out.push_back(trim_copy(std::string_view(line).substr(start)));
            return out;
        }
        out.push_back(trim_copy(std::string_view(line).substr(start, pos - start)));
        start = pos + 1;
    }
}

double parse_field(const std::string& token, const std::string& column) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(token, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number in column '" + column + "': " + token);
    }
    if (pos != token.size() || !std::isfinite(v)) {
        throw std::runtime_error("invalid number in column '" + column + "': " + token);
    }
    return v;
}

struct Columns {
    int date = -1;
    int score = -1;
    std::vector<int> metric;  // metric index -> column index, -1 when absent
};

Columns map_columns(const std::vector<std::string>& header) {
    Columns c;
    c.metric.assign(kNumMetrics, -1);
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string& name = header[i];
        if (name == "date") {
            c.date = static_cast<int>(i);
        } else if (name == "satisfaction") {
            c.score = static_cast<int>(i);
        } else {
            const int m = metric_index(name);
            if (m >= 0) {
                c.metric[static_cast<size_t>(m)] = static_cast<int>(i);
            }
        }
    }
    if (c.date < 0) {
        throw std::runtime_error("entries csv: header has no 'date' column");
    }
    return c;
}

// Fields of one row; empty cells stay unset.
struct ParsedRow {
    Date day;
    std::optional<double> score;
    std::vector<std::optional<double>> metrics;
};

ParsedRow parse_row(const std::vector<std::string>& cols, const Columns& c) {
    if (cols.size() < 2 || static_cast<size_t>(c.date) >= cols.size()) {
        throw std::runtime_error("too few columns");
    }

    ParsedRow row;
    row.day = parse_date(cols[static_cast<size_t>(c.date)]);
    row.metrics.assign(kNumMetrics, std::nullopt);

    if (c.score >= 0 && static_cast<size_t>(c.score) < cols.size() && !cols[static_cast<size_t>(c.score)].empty()) {
        row.score = parse_field(cols[static_cast<size_t>(c.score)], "satisfaction");
    }

    for (size_t m = 0; m < kNumMetrics; ++m) {
        const int col = c.metric[m];
        if (col < 0 || static_cast<size_t>(col) >= cols.size() || cols[static_cast<size_t>(col)].empty()) {
            continue;
        }
        row.metrics[m] = parse_field(cols[static_cast<size_t>(col)], metric_keys()[m]);
    }
    return row;
}

// A repeated day updates the earlier entry; cells left empty keep the earlier value.
void merge_row(const ParsedRow& row, SatisfactionEntry& e) {
    e.day = row.day;
    if (row.score) {
        e.score = row.score;
    }
    for (size_t m = 0; m < kNumMetrics; ++m) {
        if (row.metrics[m]) {
            e.metrics[m] = *row.metrics[m];
        }
    }
}

}  // namespace

std::vector<SatisfactionEntry> read_entries_csv(std::istream& in, const ReadEntriesOptions& opt) {
    std::string line;
    int line_no = 0;
    std::optional<Columns> columns;
    std::map<Date, SatisfactionEntry> by_day;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim_copy(line).empty()) {
            continue;
        }

        const std::vector<std::string> cols = split_fields(line);
        if (!columns) {
            columns = map_columns(cols);
            continue;
        }

        try {
            const ParsedRow row = parse_row(cols, *columns);
            merge_row(row, by_day[row.day]);
        } catch (const std::exception& ex) {
            if (opt.strict) {
                throw std::runtime_error("entries csv line " + std::to_string(line_no) + ": " + ex.what());
            }
        }
    }
    if (!columns) {
        throw std::runtime_error("entries csv: missing header");
    }

    std::vector<SatisfactionEntry> out;
    out.reserve(by_day.size());
    for (auto& kv : by_day) {
        out.push_back(std::move(kv.second));
    }
    return out;
}

std::vector<SatisfactionEntry> read_entries_csv_file(const std::string& path, const ReadEntriesOptions& opt) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open entries csv: " + path);
    }
    return read_entries_csv(f, opt);
}

void write_entries_csv(std::ostream& out, const std::vector<SatisfactionEntry>& entries, int precision) {
    out << "date,satisfaction";
    for (const auto& key : metric_keys()) {
        out << "," << key;
    }
    out << "\n";

    std::ostringstream row;
    row << std::setprecision(precision);
    for (const auto& e : entries) {
        row.str("");
        row << format_date(e.day) << ",";
        if (e.score) {
            row << *e.score;
        }
        for (double v : e.metrics) {
            row << "," << v;
        }
        out << row.str() << "\n";
    }
}

}  // namespace healthopt
