#include "healthopt/cross_validation.hpp"

#include <cmath>
#include <exception>

#include "healthopt/errors.hpp"
#include "healthopt/feature_scaler.hpp"

#if defined(_OPENMP)
#include <omp.h>
#endif

namespace healthopt {

void set_worker_threads(int threads) {
#if defined(_OPENMP)
    if (threads > 0) {
        omp_set_num_threads(threads);
    }
#else
    (void)threads;
#endif
}

int max_worker_threads() {
#if defined(_OPENMP)
    return omp_get_max_threads();
#else
    return 1;
#endif
}

CrossValidationResult leave_one_out(const std::vector<SatisfactionEntry>& entries, const KNNOptions& opt) {
    const std::vector<SatisfactionEntry> scored = training_set(entries);
    if (scored.size() < 2) {
        throw EmptyTrainingSetError("leave_one_out: need at least 2 scored entries");
    }

    const int n = static_cast<int>(scored.size());
    const std::vector<FeatureVector> rows = feature_rows(scored);
    std::vector<double> targets;
    targets.reserve(scored.size());
    for (const auto& e : scored) {
        targets.push_back(*e.score);
    }

    std::vector<double> errors(scored.size(), 0.0);
    std::vector<std::exception_ptr> failures(scored.size());

#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        try {
            std::vector<FeatureVector> fold_rows;
            std::vector<double> fold_targets;
            fold_rows.reserve(rows.size() - 1);
            fold_targets.reserve(rows.size() - 1);
            for (int j = 0; j < n; ++j) {
                if (j == i) {
                    continue;
                }
                fold_rows.push_back(rows[static_cast<size_t>(j)]);
                fold_targets.push_back(targets[static_cast<size_t>(j)]);
            }
            const FeatureScaler scaler = FeatureScaler::fit(fold_rows);
            const KNNRegressor model = KNNRegressor::fit_rows(fold_rows, fold_targets, scaler, opt);
            errors[static_cast<size_t>(i)] = model.predict(rows[static_cast<size_t>(i)]) - targets[static_cast<size_t>(i)];
        } catch (...) {
            failures[static_cast<size_t>(i)] = std::current_exception();
        }
    }

    for (const auto& f : failures) {
        if (f) {
            std::rethrow_exception(f);
        }
    }

    CrossValidationResult res;
    res.k = opt.k;
    res.samples = n;
    double abs_sum = 0.0;
    double sq_sum = 0.0;
    for (double e : errors) {
        abs_sum += std::abs(e);
        sq_sum += e * e;
    }
    res.mae = abs_sum / static_cast<double>(n);
    res.rmse = std::sqrt(sq_sum / static_cast<double>(n));
    return res;
}

}  // namespace healthopt
