#include "rocketalloc/random_search.hpp"

#include <cstddef>
#include <iostream>
#include <mutex>
#include <random>
#include <string>
#include <utility>

#include "rocketalloc/errors.hpp"
#include "rocketalloc/logging.hpp"

namespace rocketalloc {

RandomSearchResult random_search(const ProblemSettings& settings, const RandomSearchOptions& opt) {
    if (opt.samples <= 0) {
        throw ConfigurationError("random_search: samples must be > 0");
    }
    if (opt.log_every < 0) {
        throw ConfigurationError("random_search: log_every must be >= 0");
    }

    std::mt19937_64 rng(opt.seed);
    const std::string prefix = opt.log_prefix.empty() ? std::string("[random]") : opt.log_prefix;

    RandomSearchResult out;
    out.history.reserve(static_cast<size_t>(opt.samples));

    for (int i = 0; i < opt.samples; ++i) {
        Solution sol = generate_random_solution(settings, rng);
        if (i == 0) {
            out.init_fuel = sol.fuel();
            out.best_fuel = sol.fuel();
            out.best = std::move(sol);
        } else if (sol.fuel() < out.best_fuel) {
            out.best_fuel = sol.fuel();
            out.best = std::move(sol);
        }
        out.history.push_back(out.best_fuel);
        out.samples++;

        if (opt.log_every > 0 && ((i + 1) % opt.log_every) == 0) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix << " sample=" << (i + 1) << "/" << opt.samples << " best_fuel=" << out.best_fuel
                      << "\n";
        }
    }

    return out;
}

}  // namespace rocketalloc
