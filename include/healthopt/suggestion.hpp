#pragma once

#include <string>
#include <vector>

#include "healthopt/entry.hpp"

namespace healthopt {

enum class Direction {
    kUnchanged = 0,
    kIncrease = 1,
    kDecrease = 2,
};

struct MetricDelta {
    std::string key;
    std::string name;
    double current = 0.0;
    double suggested = 0.0;
    double delta = 0.0;
    Direction direction = Direction::kUnchanged;
};

// One row per metric, in metric order. |delta| <= tol counts as unchanged.
std::vector<MetricDelta> suggestion_deltas(
    const SatisfactionEntry& current,
    const SatisfactionEntry& suggested,
    double tol = 1e-9
);

const char* direction_name(Direction d);

}  // namespace healthopt
