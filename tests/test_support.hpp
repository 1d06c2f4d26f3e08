#pragma once

#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "healthopt/entry.hpp"

namespace healthopt_test {

template <typename E, typename F>
bool throws_as(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (const std::exception& e) {
        std::cerr << "unexpected exception: " << e.what() << "\n";
        return false;
    }
    return false;
}

inline bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

inline healthopt::Date day_of(int i) {
    return healthopt::Date{2025, 1 + (i / 28) % 12, 1 + i % 28};
}

// Low-activity / high-activity anchors of the synthetic population (resting heart rate falls with activity).
inline const std::vector<double>& low_anchor() {
    static const std::vector<double> v = {4000.0, 5.5, 300.0, 10.0, 6.0, 4.0, 3000.0, 5.0, 80.0};
    return v;
}

inline const std::vector<double>& high_anchor() {
    static const std::vector<double> v = {15000.0, 9.0, 1500.0, 80.0, 15.0, 10.0, 11500.0, 30.0, 55.0};
    return v;
}

// n rated days on a line from the low anchor (score 3) to the high anchor (score 9), with a small
// deterministic wobble so the points are not collinear.
inline std::vector<healthopt::SatisfactionEntry> activity_dataset(int n = 40) {
    std::vector<healthopt::SatisfactionEntry> out;
    for (int i = 0; i < n; ++i) {
        const double a = (n > 1) ? static_cast<double>(i) / static_cast<double>(n - 1) : 0.0;
        std::vector<double> m(healthopt::kNumMetrics, 0.0);
        for (size_t j = 0; j < m.size(); ++j) {
            const double range = high_anchor()[j] - low_anchor()[j];
            m[j] = low_anchor()[j] + a * range + 0.02 * range * std::sin(1.7 * i + static_cast<double>(j));
        }
        out.push_back(healthopt::make_entry(day_of(i), m, 3.0 + 6.0 * a));
    }
    return out;
}

inline void report(const std::string& name) {
    std::cout << "[ok] " << name << "\n";
}

}  // namespace healthopt_test
