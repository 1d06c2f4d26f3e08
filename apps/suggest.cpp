#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "healthopt/annealing_optimizer.hpp"
#include "healthopt/entry.hpp"
#include "healthopt/entry_csv.hpp"
#include "healthopt/logging.hpp"
#include "healthopt/suggestion.hpp"
#include "utils/cli_parse.hpp"

namespace {

struct Args {
    std::string data;
    std::string day;
    std::vector<double> start_metrics{};
    std::optional<double> start_score;
    bool lenient = false;

    int k = 5;
    double t0 = 100.0;
    double cooling = 0.95;
    double min_temp = 1e-3;
    double step = 0.05;
    int iters = 2000;
    int restarts = 1;
    std::string objective = "reported";  // reported | predicted
    bool clamp = true;

    std::optional<std::uint64_t> seed;
    int runs = 1;
    int threads = 1;
    int log_every = 0;

    std::string out_json;
    std::string out_csv;
    int precision = 17;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--data") {
            args.data = require_arg(i, argc, argv, a);
        } else if (a == "--day") {
            args.day = require_arg(i, argc, argv, a);
        } else if (a == "--start-metrics") {
            args.start_metrics = parse_double_list(require_arg(i, argc, argv, a));
        } else if (a == "--start-score") {
            args.start_score = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--lenient") {
            args.lenient = true;
        } else if (a == "--k") {
            args.k = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--t0") {
            args.t0 = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--cooling") {
            args.cooling = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--min-temp") {
            args.min_temp = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--step") {
            args.step = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--iters") {
            args.iters = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--restarts") {
            args.restarts = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--objective") {
            args.objective = require_arg(i, argc, argv, a);
        } else if (a == "--no-clamp") {
            args.clamp = false;
        } else if (a == "--seed") {
            args.seed = parse_u64(require_arg(i, argc, argv, a));
        } else if (a == "--runs") {
            args.runs = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--threads") {
            args.threads = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--log-every") {
            args.log_every = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--out-json") {
            args.out_json = require_arg(i, argc, argv, a);
        } else if (a == "--out-csv") {
            args.out_csv = require_arg(i, argc, argv, a);
        } else if (a == "--precision") {
            args.precision = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "-h" || a == "--help") {
            std::cout
                << "Usage: suggest --data entries.csv [--lenient]\n"
                << "               [--day YYYY-MM-DD] [--start-metrics m1,...,m9 [--start-score s]]\n"
                << "               [--k K] [--t0 T] [--cooling r] [--min-temp T] [--step s] [--iters N]\n"
                << "               [--restarts R] [--objective reported|predicted] [--no-clamp]\n"
                << "               [--seed S] [--runs R] [--threads T] [--log-every N]\n"
                << "               [--out-json path] [--out-csv path] [--precision P]\n";
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    return args;
}

healthopt::SatisfactionEntry pick_start(const Args& args, const std::vector<healthopt::SatisfactionEntry>& entries) {
    if (!args.start_metrics.empty()) {
        healthopt::Date day;
        if (!args.day.empty()) {
            day = healthopt::parse_date(args.day);
        } else if (!entries.empty()) {
            day = entries.back().day;
        }
        return healthopt::make_entry(day, args.start_metrics, args.start_score);
    }

    if (!args.day.empty()) {
        const healthopt::Date day = healthopt::parse_date(args.day);
        for (const auto& e : entries) {
            if (e.day == day) {
                healthopt::SatisfactionEntry start = e;
                if (args.start_score) {
                    start.score = args.start_score;
                }
                return start;
            }
        }
        throw std::runtime_error("no entry for --day " + args.day);
    }

    // Most recent rated day.
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->has_score()) {
            return *it;
        }
    }
    throw std::runtime_error("dataset has no rated day to start from (use --day or --start-metrics)");
}

void write_metrics(std::ostream& out, const healthopt::FeatureVector& v) {
    out << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << v[i];
    }
    out << "]";
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);

        if (args.data.empty()) {
            throw std::runtime_error("--data is required");
        }
        if (args.runs <= 0) {
            throw std::runtime_error("--runs must be > 0");
        }
        if (args.iters < 0) {
            throw std::runtime_error("--iters must be >= 0");
        }
        if (args.precision < 0 || args.precision > 17) {
            throw std::runtime_error("--precision must be in [0,17]");
        }

        healthopt::ReadEntriesOptions read_opt;
        read_opt.strict = !args.lenient;
        const std::vector<healthopt::SatisfactionEntry> entries = healthopt::read_entries_csv_file(args.data, read_opt);
        const size_t scored = healthopt::training_set(entries).size();

        healthopt::AnnealingOptions opt;
        opt.k = args.k;
        opt.initial_temperature = args.t0;
        opt.cooling_rate = args.cooling;
        opt.min_temperature = args.min_temp;
        opt.step_size = args.step;
        opt.num_restarts = args.restarts;
        opt.clamp_to_observed = args.clamp;
        opt.log_every = args.log_every;
        if (args.objective == "reported") {
            opt.objective = healthopt::AnnealObjective::kReportedScore;
        } else if (args.objective == "predicted") {
            opt.objective = healthopt::AnnealObjective::kPredictedScore;
        } else {
            throw std::runtime_error("invalid --objective (use reported|predicted)");
        }

        const std::uint64_t base_seed = args.seed ? *args.seed : std::random_device{}();
        const healthopt::SatisfactionEntry start = pick_start(args, entries);

        if (args.log_every > 0) {
            std::lock_guard<std::mutex> lk(healthopt::log_mutex());
            std::cerr << "[suggest] loaded " << entries.size() << " entries (" << scored << " rated) from "
                      << args.data << "; start day=" << healthopt::format_date(start.day) << "\n";
        }

        struct RunOut {
            int run = 0;
            std::uint64_t seed = 0;
            healthopt::AnnealingResult res;
            std::string error;
        };

        auto run_one = [&](int run_id) -> RunOut {
            RunOut out;
            out.run = run_id;

            constexpr std::uint64_t kSeedStride = 1'000'003ULL;
            out.seed = base_seed + static_cast<std::uint64_t>(run_id) * kSeedStride;

            healthopt::AnnealingOptions run_opt = opt;
            run_opt.seed = out.seed;
            run_opt.log_prefix = "[run " + std::to_string(run_id) + " anneal]";

            const auto t_start = std::chrono::steady_clock::now();
            try {
                // Each run fits its own scaler and regressor from the shared read-only snapshot.
                const healthopt::AnnealingOptimizer optimizer(entries, run_opt);
                std::mt19937_64 rng(out.seed);
                out.res = optimizer.optimize(start, args.iters, rng);

                if (args.log_every > 0) {
                    const auto t_end = std::chrono::steady_clock::now();
                    const double secs =
                        std::chrono::duration_cast<std::chrono::duration<double>>(t_end - t_start).count();
                    std::lock_guard<std::mutex> lk(healthopt::log_mutex());
                    std::cerr << "[run " << run_id << "] done seed=" << out.seed << " initial=" << out.res.initial_value
                              << " best=" << out.res.best_value << " attempted=" << out.res.attempted
                              << " accepted=" << out.res.accepted << " secs=" << secs << "\n";
                }
            } catch (const std::exception& e) {
                out.error = e.what();
            }
            return out;
        };

        std::vector<RunOut> runs(static_cast<size_t>(args.runs));
        if (args.runs == 1) {
            runs[0] = run_one(0);
        } else {
            int threads = args.threads;
            if (threads <= 0) {
                threads = static_cast<int>(std::thread::hardware_concurrency());
                if (threads <= 0) {
                    threads = 1;
                }
            }
            threads = std::max(1, std::min(threads, args.runs));

            std::atomic<int> next{0};
            auto worker = [&]() {
                for (;;) {
                    const int id = next.fetch_add(1);
                    if (id >= args.runs) {
                        return;
                    }
                    runs[static_cast<size_t>(id)] = run_one(id);
                }
            };

            std::vector<std::thread> pool;
            pool.reserve(static_cast<size_t>(threads));
            for (int t = 0; t < threads; ++t) {
                pool.emplace_back(worker);
            }
            for (auto& th : pool) {
                th.join();
            }
        }

        for (const auto& r : runs) {
            if (!r.error.empty()) {
                throw std::runtime_error("run " + std::to_string(r.run) + " failed: " + r.error);
            }
        }

        int best_run = 0;
        for (int i = 1; i < args.runs; ++i) {
            if (runs[static_cast<size_t>(i)].res.best_value > runs[static_cast<size_t>(best_run)].res.best_value) {
                best_run = i;
            }
        }
        const healthopt::AnnealingResult& res = runs[static_cast<size_t>(best_run)].res;
        const auto deltas = healthopt::suggestion_deltas(start, res.best);

        std::ostringstream out;
        out << std::setprecision(args.precision);
        out << "{\n";
        out << "  \"data\": {\"entries\": " << entries.size() << ", \"rated\": " << scored << "},\n";
        out << "  \"options\": {\"k\": " << opt.k << ", \"t0\": " << opt.initial_temperature
            << ", \"cooling\": " << opt.cooling_rate << ", \"min_temp\": " << opt.min_temperature
            << ", \"step\": " << opt.step_size << ", \"iters\": " << args.iters << ", \"restarts\": " << res.restarts
            << ", \"objective\": \"" << args.objective << "\", \"clamp\": " << (opt.clamp_to_observed ? "true" : "false")
            << "},\n";
        out << "  \"multi_start\": {\"runs\": " << args.runs << ", \"threads\": " << args.threads
            << ", \"best_run\": " << best_run << ", \"seed\": " << runs[static_cast<size_t>(best_run)].seed << "},\n";
        out << "  \"start\": {\"day\": \"" << healthopt::format_date(start.day) << "\", \"score\": ";
        if (start.score) {
            out << *start.score;
        } else {
            out << "null";
        }
        out << ", \"value\": " << res.initial_value << ", \"metrics\": ";
        write_metrics(out, start.metrics);
        out << "},\n";
        out << "  \"best\": {\"value\": " << res.best_value << ", \"improvement\": " << (res.best_value - res.initial_value)
            << ", \"metrics\": ";
        write_metrics(out, res.best.metrics);
        out << "},\n";
        out << "  \"counters\": {\"attempted\": " << res.attempted << ", \"accepted\": " << res.accepted
            << ", \"history\": " << res.history.size() << "},\n";
        out << "  \"deltas\": [\n";
        for (size_t i = 0; i < deltas.size(); ++i) {
            const auto& d = deltas[i];
            out << "    {\"metric\": \"" << d.key << "\", \"name\": \"" << d.name << "\", \"current\": " << d.current
                << ", \"suggested\": " << d.suggested << ", \"delta\": " << d.delta << ", \"direction\": \""
                << healthopt::direction_name(d.direction) << "\"}";
            if (i + 1 != deltas.size()) {
                out << ",";
            }
            out << "\n";
        }
        out << "  ],\n";
        out << "  \"runs\": [\n";
        for (size_t i = 0; i < runs.size(); ++i) {
            const auto& r = runs[i];
            out << "    {\"run\": " << r.run << ", \"seed\": " << r.seed << ", \"initial\": " << r.res.initial_value
                << ", \"best\": " << r.res.best_value << ", \"attempted\": " << r.res.attempted
                << ", \"accepted\": " << r.res.accepted << "}";
            if (i + 1 != runs.size()) {
                out << ",";
            }
            out << "\n";
        }
        out << "  ]\n";
        out << "}\n";

        const std::string payload = out.str();
        std::cout << payload;

        if (!args.out_json.empty()) {
            std::ofstream f(args.out_json);
            if (!f) {
                throw std::runtime_error("failed to open --out-json file: " + args.out_json);
            }
            f << payload;
        }

        if (!args.out_csv.empty()) {
            std::ofstream f(args.out_csv);
            if (!f) {
                throw std::runtime_error("failed to open --out-csv file: " + args.out_csv);
            }
            // First row is the suggestion, then the accepted trajectory.
            std::vector<healthopt::SatisfactionEntry> rows;
            rows.reserve(res.history.size() + 1);
            rows.push_back(res.best);
            rows.insert(rows.end(), res.history.begin(), res.history.end());
            healthopt::write_entries_csv(f, rows, args.precision);
            if (args.log_every > 0) {
                std::lock_guard<std::mutex> lk(healthopt::log_mutex());
                std::cerr << "[suggest] wrote " << rows.size() << " rows: " << args.out_csv << "\n";
            }
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
