#include "healthopt/metric_bounds.hpp"

#include <algorithm>

#include "healthopt/errors.hpp"

namespace healthopt {

MetricBounds observed_bounds(const std::vector<SatisfactionEntry>& entries) {
    MetricBounds b;
    if (entries.empty()) {
        return b;
    }
    const size_t dims = entries.front().metrics.size();
    b.min = entries.front().metrics;
    b.max = entries.front().metrics;
    for (const auto& e : entries) {
        if (e.metrics.size() != dims) {
            throw DimensionMismatchError("observed_bounds", dims, e.metrics.size());
        }
        for (size_t i = 0; i < dims; ++i) {
            b.min[i] = std::min(b.min[i], e.metrics[i]);
            b.max[i] = std::max(b.max[i], e.metrics[i]);
        }
    }
    return b;
}

bool within_bounds(const FeatureVector& v, const MetricBounds& b, double eps) {
    if (b.empty()) {
        return true;
    }
    if (v.size() != b.dims()) {
        return false;
    }
    for (size_t i = 0; i < v.size(); ++i) {
        if (v[i] < b.min[i] - eps || v[i] > b.max[i] + eps) {
            return false;
        }
    }
    return true;
}

FeatureVector clamp_to_bounds(FeatureVector v, const MetricBounds& b) {
    if (b.empty()) {
        return v;
    }
    if (v.size() != b.dims()) {
        throw DimensionMismatchError("clamp_to_bounds", b.dims(), v.size());
    }
    for (size_t i = 0; i < v.size(); ++i) {
        v[i] = std::clamp(v[i], b.min[i], b.max[i]);
    }
    return v;
}

}  // namespace healthopt
