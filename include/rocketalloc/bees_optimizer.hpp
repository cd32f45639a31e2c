#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "rocketalloc/problem_settings.hpp"
#include "rocketalloc/solution.hpp"

namespace rocketalloc {

struct BeesOptions {
    int population_size = 12;

    // Sites ranked [0, num_elite_sites) are elite, the next num_best_sites are "best",
    // the remainder are scouts (re-sampled every iteration).
    int num_elite_sites = 3;
    int num_best_sites = 3;

    // Neighbors spawned per site each iteration.
    int elite_bees_count = 4;
    int best_bees_count = 2;

    // Patch = modules reassigned per neighbor; decays geometrically down to min_patch_size.
    double initial_patch_size = 5.0;
    double patch_decay_factor = 0.98;
    double min_patch_size = 1.0;

    int stagnation_limit = 20;  // failed local searches before a site is abandoned
    int max_iterations = 1000;
    int early_stop_iterations = 0;  // if >0, stop after this many iterations without a new global best

    int max_move_attempts = 8;  // neighbor draws before accepting one identical to its site

    int threads = 0;  // OpenMP threads for local search; 0 uses the runtime default

    // If > 0, print progress every k iterations to stderr.
    int log_every = 0;
    std::string log_prefix = "[bees]";
};

struct BeesSite {
    Solution solution;
    int stagnation = 0;
};

struct BeesResult {
    Solution best;

    double init_fuel = 0.0;  // best of the scouting population
    double best_fuel = 0.0;

    // Global best fuel after each completed iteration (non-increasing).
    std::vector<double> history;

    int iterations = 0;
    bool stopped_early = false;
    double final_patch_size = 0.0;

    std::int64_t neighbors_evaluated = 0;
    std::int64_t site_improvements = 0;
    std::int64_t sites_abandoned = 0;
    std::int64_t scouts_spawned = 0;
};

// Bees algorithm over module-to-rocket allocations. Deterministic for a given seed, independent of
// the number of OpenMP threads. `settings` must outlive the optimizer.
class BeesOptimizer {
public:
    // Throws ConfigurationError on invalid options.
    BeesOptimizer(const ProblemSettings& settings, const BeesOptions& opt);

    BeesResult run(std::uint64_t seed);

    // Step-wise interface; run() is reset() followed by step() until termination.
    void reset(std::uint64_t seed);
    double step();

    bool done() const;
    const Solution& current_best() const;
    const std::vector<BeesSite>& population() const { return population_; }
    const BeesResult& stats() const { return stats_; }
    double patch_size() const { return patch_size_; }

    const BeesOptions& options() const { return opt_; }

private:
    const ProblemSettings& settings_;
    BeesOptions opt_;

    std::mt19937_64 rng_;
    std::vector<BeesSite> population_;
    BeesResult stats_;
    double patch_size_ = 0.0;
    int since_improvement_ = 0;
    bool initialized_ = false;

    void validate_options() const;
    void local_search();
    void log_progress(const char* what) const;
};

}  // namespace rocketalloc
