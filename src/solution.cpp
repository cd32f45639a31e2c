#include "rocketalloc/solution.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <string>
#include <utility>

#include "rocketalloc/errors.hpp"

namespace rocketalloc {
namespace {

void require_coverage(const ProblemSettings& settings, const Allocation& allocation) {
    if (static_cast<int>(allocation.size()) != settings.num_modules()) {
        throw AlgorithmInvariantError("allocation covers " + std::to_string(allocation.size()) + " modules, expected " +
                                      std::to_string(settings.num_modules()));
    }
    for (size_t m = 0; m < allocation.size(); ++m) {
        const int r = allocation[m];
        if (r < 0 || r >= settings.num_rockets()) {
            throw AlgorithmInvariantError("module " + std::to_string(m) + " assigned to out-of-range rocket " +
                                          std::to_string(r));
        }
    }
}

}  // namespace

Solution::Solution(const ProblemSettings& settings, Allocation allocation)
    : allocation_(std::move(allocation)) {
    fuel_ = evaluate_fuel(settings, allocation_);
    feasible_ = is_feasible(settings, allocation_);
}

double evaluate_fuel(const ProblemSettings& settings, const Allocation& allocation) {
    require_coverage(settings, allocation);

    std::vector<char> loaded(static_cast<size_t>(settings.num_rockets()), 0);
    double fuel = 0.0;
    for (int m = 0; m < settings.num_modules(); ++m) {
        const int r = allocation[static_cast<size_t>(m)];
        fuel += settings.cost(r, m);
        loaded[static_cast<size_t>(r)] = 1;
    }
    for (int r = 0; r < settings.num_rockets(); ++r) {
        if (loaded[static_cast<size_t>(r)]) {
            fuel += settings.base_fuel(r);
        }
    }
    return fuel;
}

std::vector<int> rocket_loads(const ProblemSettings& settings, const Allocation& allocation) {
    require_coverage(settings, allocation);

    std::vector<int> loads(static_cast<size_t>(settings.num_rockets()), 0);
    for (int r : allocation) {
        loads[static_cast<size_t>(r)]++;
    }
    return loads;
}

bool is_feasible(const ProblemSettings& settings, const Allocation& allocation) {
    if (static_cast<int>(allocation.size()) != settings.num_modules()) {
        return false;
    }
    std::vector<int> loads(static_cast<size_t>(settings.num_rockets()), 0);
    for (int r : allocation) {
        if (r < 0 || r >= settings.num_rockets()) {
            return false;
        }
        if (++loads[static_cast<size_t>(r)] > settings.capacity(r)) {
            return false;
        }
    }
    return true;
}

Solution make_solution(const ProblemSettings& settings, Allocation allocation) {
    Solution sol(settings, std::move(allocation));
    if (!sol.feasible()) {
        const auto loads = rocket_loads(settings, sol.allocation());
        for (int r = 0; r < settings.num_rockets(); ++r) {
            if (loads[static_cast<size_t>(r)] > settings.capacity(r)) {
                throw AlgorithmInvariantError("rocket " + std::to_string(r) + " carries " +
                                              std::to_string(loads[static_cast<size_t>(r)]) +
                                              " modules, capacity is " + std::to_string(settings.capacity(r)));
            }
        }
        throw AlgorithmInvariantError("allocation is not feasible");
    }
    return sol;
}

Solution generate_random_solution(const ProblemSettings& settings, std::mt19937_64& rng) {
    const int n = settings.num_modules();

    std::vector<int> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<int> remaining = settings.capacities();
    std::vector<int> open;
    open.reserve(remaining.size());
    for (int r = 0; r < settings.num_rockets(); ++r) {
        if (remaining[static_cast<size_t>(r)] > 0) {
            open.push_back(r);
        }
    }

    Allocation allocation(static_cast<size_t>(n), -1);
    for (int m : order) {
        if (open.empty()) {
            throw AlgorithmInvariantError("no rocket has room left for module " + std::to_string(m));
        }
        std::uniform_int_distribution<int> pick(0, static_cast<int>(open.size()) - 1);
        const int slot = pick(rng);
        const int r = open[static_cast<size_t>(slot)];
        allocation[static_cast<size_t>(m)] = r;
        if (--remaining[static_cast<size_t>(r)] == 0) {
            open[static_cast<size_t>(slot)] = open.back();
            open.pop_back();
        }
    }

    return make_solution(settings, std::move(allocation));
}

Solution neighbor_solution(const ProblemSettings& settings,
                           const Solution& parent,
                           int patch_size,
                           std::mt19937_64& rng,
                           int max_move_attempts) {
    const int n = settings.num_modules();
    const int k = std::clamp(patch_size, 0, n);

    const Allocation& base = parent.allocation();
    const std::vector<int> base_loads = rocket_loads(settings, base);
    if (k == 0 || settings.num_rockets() < 2) {
        return make_solution(settings, base);
    }

    std::vector<int> modules(static_cast<size_t>(n));
    std::iota(modules.begin(), modules.end(), 0);
    std::vector<int> open;
    open.reserve(static_cast<size_t>(settings.num_rockets()));

    Allocation allocation;
    const int attempts = std::max(1, max_move_attempts);
    for (int attempt = 0; attempt < attempts; ++attempt) {
        allocation = base;
        std::vector<int> loads = base_loads;

        // Partial Fisher-Yates: the first k entries are the picked modules.
        for (int i = 0; i < k; ++i) {
            std::uniform_int_distribution<int> pick(i, n - 1);
            std::swap(modules[static_cast<size_t>(i)], modules[static_cast<size_t>(pick(rng))]);
        }
        // Take every picked module off first so their slots are free for each other.
        for (int i = 0; i < k; ++i) {
            loads[static_cast<size_t>(base[static_cast<size_t>(modules[static_cast<size_t>(i)])])]--;
        }

        for (int i = 0; i < k; ++i) {
            const int m = modules[static_cast<size_t>(i)];
            const int from = base[static_cast<size_t>(m)];

            open.clear();
            for (int r = 0; r < settings.num_rockets(); ++r) {
                if (r != from && loads[static_cast<size_t>(r)] < settings.capacity(r)) {
                    open.push_back(r);
                }
            }
            int to = from;
            if (!open.empty()) {
                std::uniform_int_distribution<int> pick(0, static_cast<int>(open.size()) - 1);
                to = open[static_cast<size_t>(pick(rng))];
            }

            allocation[static_cast<size_t>(m)] = to;
            loads[static_cast<size_t>(to)]++;
        }

        if (allocation != base) {
            break;
        }
    }

    return make_solution(settings, std::move(allocation));
}

}  // namespace rocketalloc
