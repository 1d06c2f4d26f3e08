#undef NDEBUG

#include <cassert>
#include <stdexcept>
#include <cmath>
#include <iostream>
#include <vector>

#include "healthopt/errors.hpp"
#include "healthopt/feature_scaler.hpp"
#include "test_support.hpp"

using healthopt::DimensionMismatchError;
using healthopt::FeatureScaler;
using healthopt::UnfittedModelError;
using healthopt_test::near;
using healthopt_test::throws_as;

namespace {

void test_min_mid_max() {
    const FeatureScaler s = FeatureScaler::fit({
        {10.0, 20.0, 30.0},
        {20.0, 40.0, 60.0},
        {30.0, 60.0, 90.0},
    });
    assert(s.is_fitted());
    assert(s.dims() == 3);

    for (double v : s.transform({10.0, 20.0, 30.0})) {
        assert(v == 0.0);
    }
    for (double v : s.transform({20.0, 40.0, 60.0})) {
        assert(v == 0.5);
    }
    for (double v : s.transform({30.0, 60.0, 90.0})) {
        assert(v == 1.0);
    }
    healthopt_test::report("min/mid/max map to 0/0.5/1");
}

void test_transform_between_points() {
    const FeatureScaler s = FeatureScaler::fit({{0.0, 0.0}, {10.0, 20.0}, {20.0, 40.0}});
    const auto t = s.transform({15.0, 30.0});
    assert(near(t[0], 0.75));
    assert(near(t[1], 0.75));
    healthopt_test::report("interior point");
}

void test_zero_variance_dimension() {
    const FeatureScaler s = FeatureScaler::fit({{5.0, 1.0}, {5.0, 2.0}, {5.0, 3.0}});
    assert(s.transform({5.0, 2.0})[0] == 0.0);
    assert(s.transform({123.0, 2.0})[0] == 0.0);
    assert(s.transform({-7.0, 2.0})[0] == 0.0);
    assert(near(s.transform({5.0, 2.0})[1], 0.5));
    assert(s.inverse_transform({0.7, 0.5})[0] == 5.0);
    healthopt_test::report("zero-variance dimension");
}

void test_inverse_round_trip_and_extrapolation() {
    const std::vector<std::vector<double>> rows = {{0.0, 100.0}, {50.0, 200.0}, {100.0, 300.0}, {37.5, 112.25}};
    const FeatureScaler s = FeatureScaler::fit(rows);
    for (const auto& r : rows) {
        const auto back = s.inverse_transform(s.transform(r));
        assert(near(back[0], r[0], 1e-9));
        assert(near(back[1], r[1], 1e-9));
    }

    const auto lo = s.inverse_transform({0.0, 0.0});
    assert(near(lo[0], 0.0) && near(lo[1], 100.0));
    const auto hi = s.inverse_transform({1.0, 1.0});
    assert(near(hi[0], 100.0) && near(hi[1], 300.0));

    // Outside the fitted range values extrapolate instead of clamping.
    const auto out = s.transform({150.0, 0.0});
    assert(near(out[0], 1.5));
    assert(near(out[1], -0.5));
    healthopt_test::report("inverse transform");
}

void test_unfitted_and_mismatch_errors() {
    const FeatureScaler unfitted;
    assert(!unfitted.is_fitted());
    assert(throws_as<UnfittedModelError>([&] { (void)unfitted.transform({1.0, 2.0}); }));
    assert(throws_as<UnfittedModelError>([&] { (void)unfitted.inverse_transform({0.5, 0.5}); }));

    const FeatureScaler empty = FeatureScaler::fit({});
    assert(!empty.is_fitted());
    assert(throws_as<UnfittedModelError>([&] { (void)empty.transform({1.0}); }));

    const FeatureScaler s = FeatureScaler::fit({{0.0, 0.0}, {1.0, 1.0}});
    assert(throws_as<DimensionMismatchError>([&] { (void)s.transform({1.0, 2.0, 3.0}); }));
    assert(throws_as<DimensionMismatchError>([&] { (void)s.inverse_transform({0.5}); }));
    assert(throws_as<DimensionMismatchError>([&] { (void)FeatureScaler::fit({{0.0, 0.0}, {1.0}}); }));
    assert(throws_as<std::invalid_argument>([&] { (void)FeatureScaler::fit({{0.0, std::nan("")}, {1.0, 1.0}}); }));
    assert(throws_as<std::invalid_argument>([&] { (void)FeatureScaler::fit({{0.0, 0.0}, {-HUGE_VAL, 1.0}}); }));
    healthopt_test::report("unfitted / mismatch / non-finite errors");
}

void test_fit_returns_new_value() {
    const FeatureScaler a = FeatureScaler::fit({{0.0}, {10.0}});
    const FeatureScaler b = FeatureScaler::fit({{0.0}, {20.0}});
    assert(near(a.transform({5.0})[0], 0.5));
    assert(near(b.transform({5.0})[0], 0.25));
    healthopt_test::report("independent fits");
}

}  // namespace

int main() {
    test_min_mid_max();
    test_transform_between_points();
    test_zero_variance_dimension();
    test_inverse_round_trip_and_extrapolation();
    test_unfitted_and_mismatch_errors();
    test_fit_returns_new_value();
    std::cout << "feature scaler: all tests passed\n";
    return 0;
}
