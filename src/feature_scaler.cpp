#include "healthopt/feature_scaler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "healthopt/errors.hpp"

namespace healthopt {

FeatureScaler FeatureScaler::fit(const std::vector<FeatureVector>& rows) {
    FeatureScaler s;
    if (rows.empty()) {
        return s;
    }

    const size_t dims = rows.front().size();
    s.mins_ = rows.front();
    s.maxs_ = rows.front();
    for (const auto& row : rows) {
        if (row.size() != dims) {
            throw DimensionMismatchError("FeatureScaler::fit", dims, row.size());
        }
        for (size_t i = 0; i < dims; ++i) {
            if (!std::isfinite(row[i])) {
                throw std::invalid_argument("FeatureScaler::fit: non-finite value in dimension " + std::to_string(i));
            }
            s.mins_[i] = std::min(s.mins_[i], row[i]);
            s.maxs_[i] = std::max(s.maxs_[i], row[i]);
        }
    }
    s.fitted_ = true;
    return s;
}

void FeatureScaler::require_fitted(const char* where, size_t n) const {
    if (!fitted_) {
        throw UnfittedModelError(std::string(where) + ": scaler must be fitted first");
    }
    if (n != mins_.size()) {
        throw DimensionMismatchError(where, mins_.size(), n);
    }
}

FeatureVector FeatureScaler::transform(const FeatureVector& v) const {
    require_fitted("FeatureScaler::transform", v.size());
    FeatureVector out(v.size(), 0.0);
    for (size_t i = 0; i < v.size(); ++i) {
        const double range = maxs_[i] - mins_[i];
        out[i] = (range > 0.0) ? (v[i] - mins_[i]) / range : 0.0;
    }
    return out;
}

FeatureVector FeatureScaler::inverse_transform(const FeatureVector& scaled) const {
    require_fitted("FeatureScaler::inverse_transform", scaled.size());
    FeatureVector out(scaled.size(), 0.0);
    for (size_t i = 0; i < scaled.size(); ++i) {
        out[i] = scaled[i] * (maxs_[i] - mins_[i]) + mins_[i];
    }
    return out;
}

}  // namespace healthopt
