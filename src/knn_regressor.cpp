#include "healthopt/knn_regressor.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include "healthopt/distance.hpp"
#include "healthopt/errors.hpp"

namespace healthopt {
namespace {

void validate_options(const KNNOptions& opt) {
    if (opt.k < 1) {
        throw std::invalid_argument("KNNRegressor: k must be >= 1");
    }
    if (!(opt.epsilon > 0.0)) {
        throw std::invalid_argument("KNNRegressor: epsilon must be > 0");
    }
}

}  // namespace

KNNRegressor KNNRegressor::fit(
    const std::vector<SatisfactionEntry>& entries,
    const FeatureScaler& scaler,
    const KNNOptions& opt
) {
    std::vector<FeatureVector> rows;
    std::vector<double> targets;
    rows.reserve(entries.size());
    targets.reserve(entries.size());
    for (const auto& e : entries) {
        if (!e.score) {
            continue;
        }
        rows.push_back(e.metrics);
        targets.push_back(*e.score);
    }
    return fit_rows(rows, targets, scaler, opt);
}

KNNRegressor KNNRegressor::fit_rows(
    const std::vector<FeatureVector>& rows,
    const std::vector<double>& targets,
    const FeatureScaler& scaler,
    const KNNOptions& opt
) {
    validate_options(opt);
    if (rows.size() != targets.size()) {
        throw std::invalid_argument("KNNRegressor::fit_rows: rows and targets must have the same size");
    }

    KNNRegressor r;
    r.opt_ = opt;
    if (rows.empty()) {
        return r;
    }
    if (!scaler.is_fitted()) {
        throw UnfittedModelError("KNNRegressor::fit: scaler must be fitted on the training set first");
    }

    r.scaler_ = scaler;
    r.points_.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        r.points_.push_back(Point{scaler.transform(rows[i]), targets[i]});
    }
    return r;
}

double KNNRegressor::predict(const FeatureVector& raw) const {
    if (!is_fitted()) {
        throw UnfittedModelError("KNNRegressor::predict: model must be fitted before prediction");
    }
    return predict_scaled(scaler_.transform(raw));
}

double KNNRegressor::predict_scaled(const FeatureVector& scaled) const {
    if (!is_fitted()) {
        throw UnfittedModelError("KNNRegressor::predict: model must be fitted before prediction");
    }
    if (scaled.size() != dims()) {
        throw DimensionMismatchError("KNNRegressor::predict", dims(), scaled.size());
    }

    std::vector<std::pair<double, size_t>> dist;
    dist.reserve(points_.size());
    for (size_t i = 0; i < points_.size(); ++i) {
        dist.emplace_back(euclidean_distance(scaled, points_[i].scaled), i);
    }

    // Pair ordering breaks distance ties by input index.
    const size_t n = std::min(static_cast<size_t>(opt_.k), dist.size());
    std::partial_sort(dist.begin(), dist.begin() + static_cast<std::ptrdiff_t>(n), dist.end());

    double weighted = 0.0;
    double total = 0.0;
    for (size_t j = 0; j < n; ++j) {
        const double w = 1.0 / (dist[j].first + opt_.epsilon);
        weighted += w * points_[dist[j].second].target;
        total += w;
    }
    return weighted / total;
}

}  // namespace healthopt
