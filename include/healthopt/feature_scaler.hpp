#pragma once

#include <cstddef>
#include <vector>

#include "healthopt/entry.hpp"

namespace healthopt {

// Min-max normalization of every dimension to [0,1].
//
// A default-constructed scaler is unfitted; fit() returns a new fitted value and never mutates an
// existing one, so several regressors can share the same scaler.
class FeatureScaler {
public:
    FeatureScaler() = default;

    // Per-dimension min/max over `rows`. An empty `rows` yields an unfitted scaler; NaN or infinite
    // values throw std::invalid_argument.
    static FeatureScaler fit(const std::vector<FeatureVector>& rows);

    // (x - min) / (max - min), 0 on zero-variance dimensions. Values outside the fitted range
    // extrapolate linearly.
    FeatureVector transform(const FeatureVector& v) const;
    FeatureVector inverse_transform(const FeatureVector& scaled) const;

    bool is_fitted() const { return fitted_; }
    size_t dims() const { return mins_.size(); }
    const std::vector<double>& mins() const { return mins_; }
    const std::vector<double>& maxs() const { return maxs_; }

private:
    void require_fitted(const char* where, size_t n) const;

    std::vector<double> mins_;
    std::vector<double> maxs_;
    bool fitted_ = false;
};

}  // namespace healthopt
