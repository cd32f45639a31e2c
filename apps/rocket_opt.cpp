#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "rocketalloc/bees_optimizer.hpp"
#include "rocketalloc/cli_parse.hpp"
#include "rocketalloc/problem_io.hpp"
#include "rocketalloc/problem_settings.hpp"
#include "rocketalloc/random_search.hpp"

namespace {

struct Args {
    std::string in;  // empty => built-in example instance

    // Built-in example: rocket type per rocket, module count per module type.
    std::vector<int> example_rocket_types{0, 1, 0, 1};
    std::vector<int> example_module_amounts{6, 15, 9, 5};
    int example_capacity = 10;

    std::uint64_t seed = 1;
    int runs = 1;
    int threads = 1;
    int omp_threads = 0;

    rocketalloc::BeesOptions bees;

    int random_samples = 1000;  // 0 disables the baseline
    int log_every = 0;
    bool history = false;
    bool print_problem = false;
};

// Two rocket types and four module types from the reference example; each rocket is given a type,
// each module type is expanded into `amounts[t]` individual modules.
rocketalloc::ProblemSettings example_problem(const std::vector<int>& rocket_types,
                                             const std::vector<int>& module_amounts,
                                             int capacity) {
    static const double kTypeBaseFuel[2] = {39.9175704, 47.029129};
    static const double kTypeModuleFuel[2][4] = {
        {3.22714791, 6.39551519, 5.92349917, 3.02169468},
        {9.31912442, 8.56746934, 9.37825445, 1.80524675},
    };

    if (module_amounts.size() != 4) {
        throw std::runtime_error("--example-amounts expects 4 module-type counts");
    }
    std::vector<int> module_type;
    for (int t = 0; t < 4; ++t) {
        if (module_amounts[static_cast<size_t>(t)] < 0) {
            throw std::runtime_error("--example-amounts must be >= 0");
        }
        module_type.insert(module_type.end(), static_cast<size_t>(module_amounts[static_cast<size_t>(t)]), t);
    }

    const int num_rockets = static_cast<int>(rocket_types.size());
    std::vector<int> capacities(rocket_types.size(), capacity);
    std::vector<double> base_fuel;
    rocketalloc::CostMatrix cost;
    for (int type : rocket_types) {
        if (type < 0 || type > 1) {
            throw std::runtime_error("--example-rockets entries must be 0 or 1");
        }
        base_fuel.push_back(kTypeBaseFuel[type]);
        std::vector<double> row;
        row.reserve(module_type.size());
        for (int t : module_type) {
            row.push_back(kTypeModuleFuel[type][t]);
        }
        cost.push_back(std::move(row));
    }

    return rocketalloc::ProblemSettings(num_rockets,
                                        static_cast<int>(module_type.size()),
                                        std::move(capacities),
                                        std::move(base_fuel),
                                        std::move(cost));
}

void print_usage() {
    std::cout << "Usage: rocket_opt [--in problem.txt] [--seed 1] [--runs 1] [--threads 1] [--omp-threads 0]\n"
              << "                  [--pop 12] [--elite-sites 3] [--best-sites 3] [--elite-bees 4] [--best-bees 2]\n"
              << "                  [--patch 5] [--patch-decay 0.98] [--patch-min 1] [--stagnation 20]\n"
              << "                  [--iters 1000] [--early-stop 0] [--move-attempts 8]\n"
              << "                  [--random-samples 1000] [--log-every 0] [--history] [--print-problem]\n"
              << "                  [--example-rockets 0,1,0,1] [--example-amounts 6,15,9,5] [--example-capacity 10]\n";
}

Args parse_args(int argc, char** argv) {
    using rocketalloc::double_arg;
    using rocketalloc::int_arg;
    using rocketalloc::require_arg;

    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--in") {
            args.in = require_arg(i, argc, argv, a);
        } else if (a == "--example-rockets") {
            args.example_rocket_types = rocketalloc::int_list_arg(i, argc, argv, a);
        } else if (a == "--example-amounts") {
            args.example_module_amounts = rocketalloc::int_list_arg(i, argc, argv, a);
        } else if (a == "--example-capacity") {
            args.example_capacity = int_arg(i, argc, argv, a);
        } else if (a == "--seed") {
            args.seed = rocketalloc::u64_arg(i, argc, argv, a);
        } else if (a == "--runs") {
            args.runs = int_arg(i, argc, argv, a);
        } else if (a == "--threads") {
            args.threads = int_arg(i, argc, argv, a);
        } else if (a == "--omp-threads") {
            args.omp_threads = int_arg(i, argc, argv, a);
        } else if (a == "--pop") {
            args.bees.population_size = int_arg(i, argc, argv, a);
        } else if (a == "--elite-sites") {
            args.bees.num_elite_sites = int_arg(i, argc, argv, a);
        } else if (a == "--best-sites") {
            args.bees.num_best_sites = int_arg(i, argc, argv, a);
        } else if (a == "--elite-bees") {
            args.bees.elite_bees_count = int_arg(i, argc, argv, a);
        } else if (a == "--best-bees") {
            args.bees.best_bees_count = int_arg(i, argc, argv, a);
        } else if (a == "--patch") {
            args.bees.initial_patch_size = double_arg(i, argc, argv, a);
        } else if (a == "--patch-decay") {
            args.bees.patch_decay_factor = double_arg(i, argc, argv, a);
        } else if (a == "--patch-min") {
            args.bees.min_patch_size = double_arg(i, argc, argv, a);
        } else if (a == "--stagnation") {
            args.bees.stagnation_limit = int_arg(i, argc, argv, a);
        } else if (a == "--iters") {
            args.bees.max_iterations = int_arg(i, argc, argv, a);
        } else if (a == "--early-stop") {
            args.bees.early_stop_iterations = int_arg(i, argc, argv, a);
        } else if (a == "--move-attempts") {
            args.bees.max_move_attempts = int_arg(i, argc, argv, a);
        } else if (a == "--random-samples") {
            args.random_samples = int_arg(i, argc, argv, a);
        } else if (a == "--log-every") {
            args.log_every = int_arg(i, argc, argv, a);
        } else if (a == "--history") {
            args.history = true;
        } else if (a == "--print-problem") {
            args.print_problem = true;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }

    if (args.runs <= 0) {
        throw std::runtime_error("--runs must be > 0");
    }
    if (args.threads < 0) {
        throw std::runtime_error("--threads must be >= 0");
    }
    if (args.omp_threads < 0) {
        throw std::runtime_error("--omp-threads must be >= 0");
    }
    if (args.random_samples < 0) {
        throw std::runtime_error("--random-samples must be >= 0");
    }
    if (args.log_every < 0) {
        throw std::runtime_error("--log-every must be >= 0");
    }
    return args;
}

void write_fuel_list(std::ostream& out, const std::vector<double>& v) {
    out << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i != 0) {
            out << ", ";
        }
        out << v[i];
    }
    out << "]";
}

void write_int_list(std::ostream& out, const std::vector<int>& v) {
    out << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i != 0) {
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

        const rocketalloc::ProblemSettings settings = [&]() {
            if (args.in.empty()) {
                return example_problem(args.example_rocket_types, args.example_module_amounts, args.example_capacity);
            }
            std::ifstream f(args.in);
            if (!f) {
                throw std::runtime_error("failed to open: " + args.in);
            }
            return rocketalloc::read_problem(f);
        }();

        if (args.print_problem) {
            rocketalloc::write_problem(std::cerr, settings);
        }

        struct RunOut {
            int run = 0;
            std::uint64_t seed = 0;
            rocketalloc::BeesResult res;
            std::string error;
        };

        auto run_one = [&](int run_id) -> RunOut {
            RunOut out;
            out.run = run_id;
            constexpr std::uint64_t kSeedStride = 1'000'003ULL;
            out.seed = args.seed + static_cast<std::uint64_t>(run_id) * kSeedStride;

            rocketalloc::BeesOptions opt = args.bees;
            opt.threads = args.omp_threads;
            opt.log_every = args.log_every;
            opt.log_prefix = "[run " + std::to_string(run_id) + " bees]";

            try {
                rocketalloc::BeesOptimizer optimizer(settings, opt);
                out.res = optimizer.run(out.seed);
                return out;
            } catch (const std::exception& e) {
                out.error = e.what();
                return out;
            }
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
            if (runs[static_cast<size_t>(i)].res.best_fuel < runs[static_cast<size_t>(best_run)].res.best_fuel) {
                best_run = i;
            }
        }
        const auto& best = runs[static_cast<size_t>(best_run)];
        const auto loads = rocketalloc::rocket_loads(settings, best.res.best.allocation());

        rocketalloc::RandomSearchResult baseline;
        if (args.random_samples > 0) {
            rocketalloc::RandomSearchOptions ropt;
            ropt.samples = args.random_samples;
            ropt.seed = args.seed;
            ropt.log_every = (args.log_every > 0) ? std::max(1, args.random_samples / 10) : 0;
            baseline = rocketalloc::random_search(settings, ropt);
        }

        std::ostringstream out;
        out << std::setprecision(17);
        out << "{\n";
        out << "  \"problem\": {\"rockets\": " << settings.num_rockets() << ", \"modules\": " << settings.num_modules()
            << ", \"total_capacity\": " << settings.total_capacity() << "},\n";
        out << "  \"multi_start\": {\"runs\": " << args.runs << ", \"threads\": " << args.threads
            << ", \"best_run\": " << best_run << ", \"seed\": " << best.seed << "},\n";
        out << "  \"options\": {\"population_size\": " << args.bees.population_size
            << ", \"num_elite_sites\": " << args.bees.num_elite_sites
            << ", \"num_best_sites\": " << args.bees.num_best_sites
            << ", \"elite_bees_count\": " << args.bees.elite_bees_count
            << ", \"best_bees_count\": " << args.bees.best_bees_count
            << ", \"initial_patch_size\": " << args.bees.initial_patch_size
            << ", \"patch_decay_factor\": " << args.bees.patch_decay_factor
            << ", \"stagnation_limit\": " << args.bees.stagnation_limit
            << ", \"max_iterations\": " << args.bees.max_iterations << "},\n";
        out << "  \"bees\": {\"init_fuel\": " << best.res.init_fuel << ", \"best_fuel\": " << best.res.best_fuel
            << ", \"feasible\": " << (best.res.best.feasible() ? "true" : "false")
            << ", \"iterations\": " << best.res.iterations
            << ", \"stopped_early\": " << (best.res.stopped_early ? "true" : "false")
            << ", \"final_patch_size\": " << best.res.final_patch_size << "},\n";
        out << "  \"counters\": {\"neighbors_evaluated\": " << best.res.neighbors_evaluated
            << ", \"site_improvements\": " << best.res.site_improvements
            << ", \"sites_abandoned\": " << best.res.sites_abandoned
            << ", \"scouts_spawned\": " << best.res.scouts_spawned << "},\n";
        out << "  \"allocation\": ";
        write_int_list(out, best.res.best.allocation());
        out << ",\n";
        out << "  \"rocket_loads\": ";
        write_int_list(out, loads);
        out << ",\n";
        if (args.random_samples > 0) {
            out << "  \"random_baseline\": {\"samples\": " << baseline.samples << ", \"init_fuel\": "
                << baseline.init_fuel << ", \"best_fuel\": " << baseline.best_fuel << "},\n";
        } else {
            out << "  \"random_baseline\": null,\n";
        }
        out << "  \"runs\": [\n";
        for (size_t i = 0; i < runs.size(); ++i) {
            const auto& r = runs[i];
            out << "    {\"run\": " << r.run << ", \"seed\": " << r.seed << ", \"best_fuel\": " << r.res.best_fuel
                << ", \"iterations\": " << r.res.iterations << "}";
            if (i + 1 != runs.size()) {
                out << ",";
            }
            out << "\n";
        }
        out << "  ]";
        if (args.history) {
            out << ",\n  \"history\": ";
            write_fuel_list(out, best.res.history);
        }
        out << "\n}\n";

        std::cout << out.str();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
