#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "rocketalloc/problem_settings.hpp"
#include "rocketalloc/solution.hpp"

namespace rocketalloc {

struct RandomSearchOptions {
    int samples = 1000;
    std::uint64_t seed = 1;

    // If > 0, print progress every k samples to stderr.
    int log_every = 0;
    std::string log_prefix = "[random]";
};

struct RandomSearchResult {
    Solution best;

    double init_fuel = 0.0;  // fuel of the first sample
    double best_fuel = 0.0;

    // Best fuel after each sample.
    std::vector<double> history;

    int samples = 0;
};

// Baseline: independent uniform samples from generate_random_solution, keeping the best.
RandomSearchResult random_search(const ProblemSettings& settings, const RandomSearchOptions& opt);

}  // namespace rocketalloc
