#undef NDEBUG

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "healthopt/date.hpp"
#include "healthopt/entry.hpp"
#include "healthopt/errors.hpp"
#include "healthopt/metric_bounds.hpp"
#include "healthopt/suggestion.hpp"
#include "test_support.hpp"

using healthopt::Date;
using healthopt::Direction;
using healthopt_test::throws_as;

namespace {

void test_dates() {
    const Date d = healthopt::parse_date("2025-11-26");
    assert(d.year == 2025 && d.month == 11 && d.day == 26);
    assert(healthopt::format_date(d) == "2025-11-26");

    const Date ts = healthopt::parse_date("2025-11-26T08:30:00Z");
    assert(ts == d);

    assert(healthopt::parse_date("2024-02-29").day == 29);
    assert(throws_as<std::runtime_error>([] { (void)healthopt::parse_date("2025-02-29"); }));
    assert(throws_as<std::runtime_error>([] { (void)healthopt::parse_date("2025-13-01"); }));
    assert(throws_as<std::runtime_error>([] { (void)healthopt::parse_date("11/26/2025"); }));
    assert(throws_as<std::runtime_error>([] { (void)healthopt::parse_date("2025-11-2x"); }));

    assert(healthopt::parse_date("2025-01-31") < healthopt::parse_date("2025-02-01"));
    assert(healthopt::format_date(Date{7, 3, 4}) == "0007-03-04");
    healthopt_test::report("dates");
}

void test_entries() {
    assert(healthopt::metric_keys().size() == healthopt::kNumMetrics);
    assert(healthopt::metric_display_names().size() == healthopt::kNumMetrics);
    assert(healthopt::metric_index("restingHeartRateToday") == 8);
    assert(healthopt::metric_index("stepsToday") == 0);
    assert(healthopt::metric_index("mood") == -1);

    const auto rated = healthopt::make_entry(Date{2025, 1, 2}, {1, 2, 3, 4, 5, 6, 7, 8, 9}, 7.0);
    assert(rated.has_score());
    assert(rated.metric(healthopt::Metric::kSteps) == 1.0);
    assert(rated.metric(healthopt::Metric::kRestingHeartRate) == 9.0);

    const auto unrated = healthopt::make_entry(Date{2025, 1, 3}, {1, 2, 3, 4, 5, 6, 7, 8, 9});
    assert(!unrated.has_score());

    assert(throws_as<healthopt::DimensionMismatchError>(
        [] { (void)healthopt::make_entry(Date{}, {1, 2, 3, 4, 5, 6, 7, 8}); }
    ));

    const auto ts = healthopt::training_set({unrated, rated, unrated});
    assert(ts.size() == 1);
    assert(ts[0].day == rated.day);
    healthopt_test::report("entries");
}

void test_bounds() {
    const auto a = healthopt::make_entry(Date{2025, 1, 1}, {1, 10, 0, 0, 0, 0, 0, 0, 70}, 5.0);
    const auto b = healthopt::make_entry(Date{2025, 1, 2}, {3, 20, 0, 0, 0, 0, 0, 0, 50});
    const healthopt::MetricBounds bounds = healthopt::observed_bounds({a, b});
    assert(bounds.dims() == healthopt::kNumMetrics);
    assert(bounds.min[0] == 1.0 && bounds.max[0] == 3.0);
    assert(bounds.min[8] == 50.0 && bounds.max[8] == 70.0);

    const auto clamped = healthopt::clamp_to_bounds({-5, 15, 1, 0, 0, 0, 0, 0, 90}, bounds);
    assert(clamped[0] == 1.0);
    assert(clamped[1] == 15.0);
    assert(clamped[2] == 0.0);
    assert(clamped[8] == 70.0);
    assert(healthopt::within_bounds(clamped, bounds));
    assert(!healthopt::within_bounds({-5, 15, 1, 0, 0, 0, 0, 0, 90}, bounds));

    const healthopt::MetricBounds none = healthopt::observed_bounds({});
    assert(none.empty());
    const std::vector<double> v = {-1.0, 1e9};
    assert(healthopt::clamp_to_bounds(v, none) == v);
    healthopt_test::report("observed bounds");
}

void test_suggestion_deltas() {
    const auto cur = healthopt::make_entry(Date{2025, 1, 1}, {5000, 420, 400, 15, 7, 30, 4000, 8, 75}, 5.0);
    const auto sug = healthopt::make_entry(Date{2025, 1, 1}, {6500, 420, 450, 25, 7, 45, 4800, 8, 70}, 6.4);
    const auto deltas = healthopt::suggestion_deltas(cur, sug);
    assert(deltas.size() == healthopt::kNumMetrics);
    assert(deltas[0].key == "stepsToday");
    assert(deltas[0].delta == 1500.0);
    assert(deltas[0].direction == Direction::kIncrease);
    assert(deltas[1].direction == Direction::kUnchanged);
    assert(deltas[8].direction == Direction::kDecrease);
    assert(deltas[8].delta == -5.0);
    assert(std::string(healthopt::direction_name(deltas[8].direction)) == "decrease");
    healthopt_test::report("suggestion deltas");
}

}  // namespace

int main() {
    test_dates();
    test_entries();
    test_bounds();
    test_suggestion_deltas();
    std::cout << "entry: all tests passed\n";
    return 0;
}
