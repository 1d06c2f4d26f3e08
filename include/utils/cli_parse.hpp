#pragma once

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Returns argv[i + 1] and advances i, or throws when the flag is the last argument.
inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("missing value for " + flag);
    }
    return argv[++i];
}

inline int parse_int(const std::string& s) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid integer: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error("invalid integer: " + s);
    }
    return v;
}

inline std::uint64_t parse_u64(const std::string& s) {
    size_t pos = 0;
    std::uint64_t v = 0;
    try {
        v = std::stoull(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid uint64: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error("invalid uint64: " + s);
    }
    return v;
}

inline double parse_double(const std::string& s) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number: " + s);
    }
    if (pos != s.size() || !std::isfinite(v)) {
        throw std::runtime_error("invalid number: " + s);
    }
    return v;
}

inline std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

inline std::vector<double> parse_double_list(const std::string& s) {
    std::vector<double> out;
    for (const auto& item : split_commas(s)) {
        out.push_back(parse_double(item));
    }
    return out;
}

inline std::vector<int> parse_int_list(const std::string& s) {
    std::vector<int> out;
    for (const auto& item : split_commas(s)) {
        out.push_back(parse_int(item));
    }
    return out;
}
