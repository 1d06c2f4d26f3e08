#include "healthopt/annealing_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "healthopt/errors.hpp"
#include "healthopt/logging.hpp"

namespace healthopt {
namespace {

void validate_options(const AnnealingOptions& opt) {
    if (!(opt.initial_temperature > 0.0)) {
        throw std::invalid_argument("AnnealingOptimizer: initial_temperature must be > 0");
    }
    if (!(opt.min_temperature > 0.0)) {
        throw std::invalid_argument("AnnealingOptimizer: min_temperature must be > 0");
    }
    if (!(opt.cooling_rate > 0.0 && opt.cooling_rate <= 1.0)) {
        throw std::invalid_argument("AnnealingOptimizer: cooling_rate must be in (0,1]");
    }
    if (!(opt.step_size >= 0.0)) {
        throw std::invalid_argument("AnnealingOptimizer: step_size must be >= 0");
    }
}

SatisfactionEntry candidate_entry(const Date& day, const FeatureVector& metrics, double value) {
    SatisfactionEntry e;
    e.day = day;
    e.score = value;
    e.metrics = metrics;
    return e;
}

}  // namespace

AnnealingOptimizer::AnnealingOptimizer(const std::vector<SatisfactionEntry>& data, const AnnealingOptions& opt)
    : opt_(opt) {
    validate_options(opt_);

    restart_pool_ = training_set(data);
    scaler_ = FeatureScaler::fit(feature_rows(restart_pool_));

    KNNOptions knn;
    knn.k = opt_.k;
    knn.epsilon = opt_.knn_epsilon;
    regressor_ = KNNRegressor::fit(restart_pool_, scaler_, knn);

    bounds_ = observed_bounds(data);
}

AnnealingResult AnnealingOptimizer::optimize(const SatisfactionEntry& start, int max_iterations) const {
    std::mt19937_64 rng(opt_.seed);
    return optimize(start, max_iterations, rng);
}

AnnealingResult AnnealingOptimizer::optimize(
    const SatisfactionEntry& start,
    int max_iterations,
    std::mt19937_64& rng
) const {
    if (max_iterations < 0) {
        throw std::invalid_argument("AnnealingOptimizer::optimize: max_iterations must be >= 0");
    }
    if (opt_.objective == AnnealObjective::kReportedScore && !start.score) {
        throw MissingScoreError("AnnealingOptimizer::optimize: starting entry must carry a satisfaction score");
    }
    if (start.score && !std::isfinite(*start.score)) {
        throw std::invalid_argument("AnnealingOptimizer::optimize: starting score must be finite");
    }
    for (double v : start.metrics) {
        if (!std::isfinite(v)) {
            throw std::invalid_argument("AnnealingOptimizer::optimize: starting metrics must be finite");
        }
    }
    if (!regressor_.is_fitted()) {
        throw UnfittedModelError("AnnealingOptimizer::optimize: no rated entries to fit the regressor on");
    }

    const int restarts = std::max(opt_.num_restarts, 1);

    AnnealingResult res;
    res.restarts = restarts;
    for (int r = 0; r < restarts; ++r) {
        const SatisfactionEntry* run_start = &start;
        if (r > 0) {
            if (restart_pool_.empty()) {
                throw EmptyTrainingSetError("AnnealingOptimizer::optimize: no scored entry to restart from");
            }
            std::uniform_int_distribution<size_t> pick(0, restart_pool_.size() - 1);
            run_start = &restart_pool_[pick(rng)];
        }

        RunResult run = run_single(*run_start, max_iterations, r, rng);

        res.attempted += run.attempted;
        res.accepted += run.accepted;
        res.history.insert(res.history.end(), run.history.begin(), run.history.end());

        if (r == 0) {
            res.initial_value = run.start_value;
            res.best = run.best;
            res.best_value = run.best_value;
        } else if (run.best_value > res.best_value) {
            res.best = run.best;
            res.best_value = run.best_value;
        }
    }

    res.best.day = start.day;
    return res;
}

AnnealingOptimizer::RunResult AnnealingOptimizer::run_single(
    const SatisfactionEntry& start,
    int max_iterations,
    int restart_index,
    std::mt19937_64& rng
) const {
    RunResult run;

    FeatureVector current = start.metrics;
    double current_value = 0.0;
    if (opt_.objective == AnnealObjective::kReportedScore) {
        current_value = *start.score;
    } else {
        current_value = regressor_.predict(current);
    }
    run.start_value = current_value;
    run.best = candidate_entry(start.day, current, current_value);
    run.best_value = current_value;
    run.history.push_back(run.best);

    std::uniform_real_distribution<double> unif01(0.0, 1.0);
    double T = opt_.initial_temperature;

    for (int it = 0; it < max_iterations; ++it) {
        const FeatureVector candidate = propose(current, rng);
        const double candidate_value = regressor_.predict(candidate);
        run.attempted++;

        const double delta = candidate_value - current_value;
        bool accept = false;
        if (delta > 0.0) {
            accept = true;
        } else {
            accept = unif01(rng) < std::exp(delta / T);
        }

        if (accept) {
            run.accepted++;
            current = candidate;
            current_value = candidate_value;
            run.history.push_back(candidate_entry(start.day, current, current_value));
            if (current_value > run.best_value) {
                run.best_value = current_value;
                run.best = run.history.back();
            }
        }

        T = std::max(T * opt_.cooling_rate, opt_.min_temperature);

        if (opt_.log_every > 0 && ((it + 1) % opt_.log_every) == 0) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << opt_.log_prefix << " restart=" << restart_index << " it=" << (it + 1) << "/"
                      << max_iterations << " T=" << T << " cur=" << current_value << " best=" << run.best_value
                      << " accepted=" << run.accepted << "\n";
        }
    }

    if (opt_.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << opt_.log_prefix << " restart=" << restart_index << " done start=" << run.start_value
                  << " best=" << run.best_value << " attempted=" << run.attempted << " accepted=" << run.accepted
                  << "\n";
    }
    return run;
}

FeatureVector AnnealingOptimizer::propose(const FeatureVector& current, std::mt19937_64& rng) const {
    if (current.empty()) {
        throw DimensionMismatchError("AnnealingOptimizer::propose", scaler_.dims(), 0);
    }

    // Step in scaled units so every metric moves by a comparable share of its observed range.
    FeatureVector scaled = scaler_.transform(current);
    std::uniform_int_distribution<size_t> pick_dim(0, current.size() - 1);
    std::uniform_real_distribution<double> step(-opt_.step_size, opt_.step_size);
    const size_t dim = pick_dim(rng);
    scaled[dim] += step(rng);

    FeatureVector candidate = current;
    candidate[dim] = scaler_.inverse_transform(scaled)[dim];
    if (opt_.clamp_to_observed) {
        candidate = clamp_to_bounds(std::move(candidate), bounds_);
    }
    return candidate;
}

}  // namespace healthopt
