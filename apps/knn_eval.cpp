#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "healthopt/cross_validation.hpp"
#include "healthopt/entry_csv.hpp"
#include "utils/cli_parse.hpp"

namespace {

struct Args {
    std::string data;
    std::vector<int> ks{1, 3, 5, 7};
    double epsilon = 1e-8;
    int threads = 0;
    bool lenient = false;
    std::string out_json;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--data") {
            args.data = require_arg(i, argc, argv, a);
        } else if (a == "--k") {
            args.ks = parse_int_list(require_arg(i, argc, argv, a));
        } else if (a == "--epsilon") {
            args.epsilon = parse_double(require_arg(i, argc, argv, a));
        } else if (a == "--threads") {
            args.threads = parse_int(require_arg(i, argc, argv, a));
        } else if (a == "--lenient") {
            args.lenient = true;
        } else if (a == "--out-json") {
            args.out_json = require_arg(i, argc, argv, a);
        } else if (a == "-h" || a == "--help") {
            std::cout << "Usage: knn_eval --data entries.csv [--k 1,3,5,7] [--epsilon e] [--threads T] [--lenient]\n"
                      << "                [--out-json path]\n";
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.data.empty()) {
            throw std::runtime_error("--data is required");
        }
        if (args.ks.empty()) {
            throw std::runtime_error("--k must list at least one value");
        }

        healthopt::ReadEntriesOptions read_opt;
        read_opt.strict = !args.lenient;
        const auto entries = healthopt::read_entries_csv_file(args.data, read_opt);

        healthopt::set_worker_threads(args.threads);

        std::vector<healthopt::CrossValidationResult> results;
        results.reserve(args.ks.size());
        for (int k : args.ks) {
            healthopt::KNNOptions opt;
            opt.k = k;
            opt.epsilon = args.epsilon;
            results.push_back(healthopt::leave_one_out(entries, opt));
        }

        size_t best = 0;
        for (size_t i = 1; i < results.size(); ++i) {
            if (results[i].mae < results[best].mae) {
                best = i;
            }
        }

        std::ostringstream out;
        out << std::setprecision(10);
        out << "{\n";
        out << "  \"entries\": " << entries.size() << ",\n";
        out << "  \"threads\": " << healthopt::max_worker_threads() << ",\n";
        out << "  \"best_k\": " << results[best].k << ",\n";
        out << "  \"folds\": [\n";
        for (size_t i = 0; i < results.size(); ++i) {
            const auto& r = results[i];
            out << "    {\"k\": " << r.k << ", \"samples\": " << r.samples << ", \"mae\": " << r.mae
                << ", \"rmse\": " << r.rmse << "}";
            if (i + 1 != results.size()) {
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
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
