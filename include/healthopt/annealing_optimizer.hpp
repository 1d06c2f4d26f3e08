#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "healthopt/entry.hpp"
#include "healthopt/feature_scaler.hpp"
#include "healthopt/knn_regressor.hpp"
#include "healthopt/metric_bounds.hpp"

namespace healthopt {

enum class AnnealObjective {
    kReportedScore = 0,   // current value starts at the user's rating of the start day
    kPredictedScore = 1,  // current value starts at the regressor's prediction for the start day
};

struct AnnealingOptions {
    // Regressor.
    int k = 5;
    double knn_epsilon = 1e-8;

    // Temperature schedule: geometric, T <- max(T * cooling_rate, min_temperature) after every iteration.
    double initial_temperature = 100.0;
    double cooling_rate = 0.95;
    double min_temperature = 1e-3;

    // Perturbation of one dimension by U[-step_size, step_size], in scaled [0,1] units.
    double step_size = 0.05;

    // Values <= 0 run once.
    int num_restarts = 1;

    AnnealObjective objective = AnnealObjective::kReportedScore;

    // Clamp candidates to the min/max observed over the whole dataset.
    bool clamp_to_observed = true;

    // Used by the overloads that do not take a generator.
    std::uint64_t seed = 1;

    // If > 0, print progress every k iterations to stderr.
    int log_every = 0;
    std::string log_prefix = "[anneal]";
};

struct AnnealingResult {
    // Best vector found; `score` holds its value (observed for an unimproved start, predicted otherwise).
    SatisfactionEntry best;

    // Per restart: the starting point followed by every accepted candidate, restarts concatenated.
    std::vector<SatisfactionEntry> history;

    double initial_value = 0.0;
    double best_value = 0.0;

    int restarts = 0;
    int attempted = 0;
    int accepted = 0;
};

// Simulated-annealing search over metric space, using a k-NN regressor as the objective.
//
// The constructor fits its own scaler and regressor on the scored subset of `data` and records the
// observed bounds of the full dataset; the optimizer keeps no reference to `data`.
class AnnealingOptimizer {
public:
    explicit AnnealingOptimizer(const std::vector<SatisfactionEntry>& data, const AnnealingOptions& opt = {});

    // Throws MissingScoreError (before drawing from `rng`) when `start` is unscored and the objective is
    // kReportedScore, std::invalid_argument for a non-finite start, and UnfittedModelError when no rated
    // entry was available to fit on.
    AnnealingResult optimize(const SatisfactionEntry& start, int max_iterations, std::mt19937_64& rng) const;
    AnnealingResult optimize(const SatisfactionEntry& start, int max_iterations) const;

    const AnnealingOptions& options() const { return opt_; }
    const FeatureScaler& scaler() const { return scaler_; }
    const KNNRegressor& regressor() const { return regressor_; }
    const MetricBounds& bounds() const { return bounds_; }

private:
    struct RunResult {
        SatisfactionEntry best;
        double best_value = 0.0;
        double start_value = 0.0;
        std::vector<SatisfactionEntry> history;
        int attempted = 0;
        int accepted = 0;
    };

    RunResult run_single(const SatisfactionEntry& start, int max_iterations, int restart_index, std::mt19937_64& rng)
        const;
    FeatureVector propose(const FeatureVector& current, std::mt19937_64& rng) const;

    AnnealingOptions opt_;
    FeatureScaler scaler_;
    KNNRegressor regressor_;
    MetricBounds bounds_;
    std::vector<SatisfactionEntry> restart_pool_;
};

}  // namespace healthopt
