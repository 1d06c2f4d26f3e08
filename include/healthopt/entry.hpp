#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "healthopt/date.hpp"

namespace healthopt {

using FeatureVector = std::vector<double>;

// Fixed metric order shared by every component.
enum class Metric {
    kSteps = 0,
    kTimeInBed = 1,
    kActiveEnergy = 2,
    kExerciseMinutes = 3,
    kStandHours = 4,
    kDaylightMinutes = 5,
    kWalkingDistance = 6,
    kFlightsClimbed = 7,
    kRestingHeartRate = 8,
};

constexpr size_t kNumMetrics = 9;

const std::vector<std::string>& metric_keys();
const std::vector<std::string>& metric_display_names();
int metric_index(const std::string& key);  // -1 when unknown

struct SatisfactionEntry {
    Date day;
    std::optional<double> score;  // empty: not rated yet
    FeatureVector metrics = FeatureVector(kNumMetrics, 0.0);

    bool has_score() const { return score.has_value(); }
    double metric(Metric m) const { return metrics[static_cast<size_t>(m)]; }
};

// Builds an entry from a metric list; throws DimensionMismatchError unless metrics.size() == kNumMetrics.
SatisfactionEntry make_entry(const Date& day, const FeatureVector& metrics, std::optional<double> score = std::nullopt);

// Entries whose score is present, in input order.
std::vector<SatisfactionEntry> training_set(const std::vector<SatisfactionEntry>& entries);

std::vector<FeatureVector> feature_rows(const std::vector<SatisfactionEntry>& entries);

}  // namespace healthopt
