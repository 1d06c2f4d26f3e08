#include "healthopt/suggestion.hpp"

#include <cmath>

#include "healthopt/errors.hpp"

namespace healthopt {

std::vector<MetricDelta> suggestion_deltas(
    const SatisfactionEntry& current,
    const SatisfactionEntry& suggested,
    double tol
) {
    if (current.metrics.size() != kNumMetrics) {
        throw DimensionMismatchError("suggestion_deltas", kNumMetrics, current.metrics.size());
    }
    if (suggested.metrics.size() != kNumMetrics) {
        throw DimensionMismatchError("suggestion_deltas", kNumMetrics, suggested.metrics.size());
    }

    std::vector<MetricDelta> out;
    out.reserve(kNumMetrics);
    for (size_t i = 0; i < kNumMetrics; ++i) {
        MetricDelta d;
        d.key = metric_keys()[i];
        d.name = metric_display_names()[i];
        d.current = current.metrics[i];
        d.suggested = suggested.metrics[i];
        d.delta = d.suggested - d.current;
        if (std::abs(d.delta) <= tol) {
            d.direction = Direction::kUnchanged;
        } else {
            d.direction = (d.delta > 0.0) ? Direction::kIncrease : Direction::kDecrease;
        }
        out.push_back(d);
    }
    return out;
}

const char* direction_name(Direction d) {
    switch (d) {
    case Direction::kUnchanged:
        return "unchanged";
    case Direction::kIncrease:
        return "increase";
    case Direction::kDecrease:
        return "decrease";
    }
    return "unchanged";
}

}  // namespace healthopt
