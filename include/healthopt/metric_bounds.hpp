#pragma once

#include <cstddef>
#include <vector>

#include "healthopt/entry.hpp"

namespace healthopt {

// Per-dimension observed range, used to keep suggestions physiologically plausible.
struct MetricBounds {
    std::vector<double> min;
    std::vector<double> max;

    bool empty() const { return min.empty(); }
    size_t dims() const { return min.size(); }
};

// Observed min/max over every entry (scored or not). Empty input => empty bounds.
MetricBounds observed_bounds(const std::vector<SatisfactionEntry>& entries);

bool within_bounds(const FeatureVector& v, const MetricBounds& b, double eps = 0.0);

// Clamps each dimension into [min, max]. Empty bounds leave `v` unchanged.
FeatureVector clamp_to_bounds(FeatureVector v, const MetricBounds& b);

}  // namespace healthopt
