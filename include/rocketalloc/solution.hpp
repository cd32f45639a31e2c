#pragma once

#include <random>
#include <vector>

#include "rocketalloc/problem_settings.hpp"

namespace rocketalloc {

// allocation[m] = rocket carrying module m.
using Allocation = std::vector<int>;

// Evaluated allocation. Immutable: perturbations always build a new Solution.
class Solution {
public:
    Solution() = default;
    Solution(const ProblemSettings& settings, Allocation allocation);

    const Allocation& allocation() const { return allocation_; }
    double fuel() const { return fuel_; }
    bool feasible() const { return feasible_; }

private:
    Allocation allocation_;
    double fuel_ = 0.0;
    bool feasible_ = false;
};

// Fuel of a complete allocation: sum over loaded rockets of base_fuel + per-module costs.
// Rockets with no modules cost nothing. Throws AlgorithmInvariantError on a malformed allocation.
double evaluate_fuel(const ProblemSettings& settings, const Allocation& allocation);

// Module count per rocket. Throws AlgorithmInvariantError on a malformed allocation.
std::vector<int> rocket_loads(const ProblemSettings& settings, const Allocation& allocation);

// Coverage (right length, rocket ids in range) and per-rocket capacity check. Never throws.
bool is_feasible(const ProblemSettings& settings, const Allocation& allocation);

// Builds a Solution and throws AlgorithmInvariantError unless it is feasible.
Solution make_solution(const ProblemSettings& settings, Allocation allocation);

// Shuffled module order, each module placed on a rocket drawn uniformly among those with room left.
Solution generate_random_solution(const ProblemSettings& settings, std::mt19937_64& rng);

// Reassigns up to `patch_size` distinct modules of `parent`. All picked modules are taken off first, then
// each goes to a rocket drawn uniformly among the other rockets with spare capacity, or back to its own
// rocket when none has room. A draw that reproduces the parent is retried up to `max_move_attempts` times.
Solution neighbor_solution(const ProblemSettings& settings,
                           const Solution& parent,
                           int patch_size,
                           std::mt19937_64& rng,
                           int max_move_attempts = 8);

}  // namespace rocketalloc
