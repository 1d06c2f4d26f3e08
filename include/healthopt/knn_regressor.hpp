#pragma once

#include <cstddef>
#include <vector>

#include "healthopt/entry.hpp"
#include "healthopt/feature_scaler.hpp"

namespace healthopt {

struct KNNOptions {
    int k = 5;
    double epsilon = 1e-8;  // added to every distance before inverting
};

// Inverse-distance weighted k-NN regression on min-max scaled features.
class KNNRegressor {
public:
    KNNRegressor() = default;

    // Stores the scaled vector and score of every scored entry; unscored entries are skipped.
    // No scored entries => unfitted regressor.
    static KNNRegressor fit(
        const std::vector<SatisfactionEntry>& entries,
        const FeatureScaler& scaler,
        const KNNOptions& opt = {}
    );

    // Same as fit() for raw feature rows with parallel targets.
    static KNNRegressor fit_rows(
        const std::vector<FeatureVector>& rows,
        const std::vector<double>& targets,
        const FeatureScaler& scaler,
        const KNNOptions& opt = {}
    );

    // Query in raw metric units; scaled through the stored scaler.
    double predict(const FeatureVector& raw) const;
    // Query already in scaled [0,1] space.
    double predict_scaled(const FeatureVector& scaled) const;

    bool is_fitted() const { return !points_.empty(); }
    size_t size() const { return points_.size(); }
    size_t dims() const { return scaler_.dims(); }
    const KNNOptions& options() const { return opt_; }
    const FeatureScaler& scaler() const { return scaler_; }

private:
    struct Point {
        FeatureVector scaled;
        double target = 0.0;
    };

    KNNOptions opt_;
    FeatureScaler scaler_;
    std::vector<Point> points_;
};

}  // namespace healthopt
