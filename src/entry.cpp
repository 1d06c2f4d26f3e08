#include "healthopt/entry.hpp"

#include "healthopt/errors.hpp"

namespace healthopt {

const std::vector<std::string>& metric_keys() {
    static const std::vector<std::string> keys = {
        "stepsToday",
        "timeInBedLastNight",
        "activeEnergyToday",
        "exerciseMinutesToday",
        "standHoursToday",
        "daylightTimeToday",
        "distanceWalkingToday",
        "flightsClimbedToday",
        "restingHeartRateToday",
    };
    return keys;
}

const std::vector<std::string>& metric_display_names() {
    static const std::vector<std::string> names = {
        "Steps",
        "Time in bed (min)",
        "Active energy (kcal)",
        "Exercise (min)",
        "Stand hours",
        "Time in daylight (min)",
        "Walking distance (m)",
        "Flights climbed",
        "Resting heart rate (bpm)",
    };
    return names;
}

int metric_index(const std::string& key) {
    const auto& keys = metric_keys();
    for (size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == key) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

SatisfactionEntry make_entry(const Date& day, const FeatureVector& metrics, std::optional<double> score) {
    if (metrics.size() != kNumMetrics) {
        throw DimensionMismatchError("make_entry", kNumMetrics, metrics.size());
    }
    SatisfactionEntry e;
    e.day = day;
    e.score = score;
    e.metrics = metrics;
    return e;
}

std::vector<SatisfactionEntry> training_set(const std::vector<SatisfactionEntry>& entries) {
    std::vector<SatisfactionEntry> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        if (e.has_score()) {
            out.push_back(e);
        }
    }
    return out;
}

std::vector<FeatureVector> feature_rows(const std::vector<SatisfactionEntry>& entries) {
    std::vector<FeatureVector> rows;
    rows.reserve(entries.size());
    for (const auto& e : entries) {
        rows.push_back(e.metrics);
    }
    return rows;
}

}  // namespace healthopt
