#pragma once

#include <vector>

#include "healthopt/entry.hpp"
#include "healthopt/knn_regressor.hpp"

namespace healthopt {

struct CrossValidationResult {
    int k = 0;
    int samples = 0;
    double mae = 0.0;
    double rmse = 0.0;
};

// Leave-one-out error of the scaler + regressor pipeline over the scored entries. Each fold refits
// the scaler without the held-out entry. Throws EmptyTrainingSetError with fewer than 2 scored entries.
CrossValidationResult leave_one_out(const std::vector<SatisfactionEntry>& entries, const KNNOptions& opt);

// OpenMP thread count used by leave_one_out(); no-ops when built without OpenMP.
void set_worker_threads(int threads);
int max_worker_threads();

}  // namespace healthopt
