#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "healthopt/entry.hpp"

namespace healthopt {

struct ReadEntriesOptions {
    bool strict = false;  // throw on a malformed row instead of skipping it
};

// Header row with a "date" column, an optional "satisfaction" column and any subset of metric_keys().
// Rows for an already-seen day replace the earlier row. Output is sorted by day.
std::vector<SatisfactionEntry> read_entries_csv(std::istream& in, const ReadEntriesOptions& opt = {});
std::vector<SatisfactionEntry> read_entries_csv_file(const std::string& path, const ReadEntriesOptions& opt = {});

void write_entries_csv(std::ostream& out, const std::vector<SatisfactionEntry>& entries, int precision = 6);

}  // namespace healthopt
