#include "rocketalloc/bees_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rocketalloc/errors.hpp"
#include "rocketalloc/logging.hpp"

#if defined(_OPENMP)
#include <omp.h>
#endif

namespace rocketalloc {
namespace {

int omp_max_threads() {
#if defined(_OPENMP)
    return omp_get_max_threads();
#else
    return 1;
#endif
}

struct SiteOutcome {
    Solution best;
    bool improved = false;
    int evaluated = 0;
    std::exception_ptr error;
};

// Best of `bees` neighbors of `site`; `improved` only on a strict fuel decrease.
SiteOutcome search_site(const ProblemSettings& settings,
                        const Solution& site,
                        int bees,
                        int patch,
                        int max_move_attempts,
                        std::uint64_t seed) {
    SiteOutcome out;
    std::mt19937_64 rng(seed);
    double best_fuel = site.fuel();
    for (int b = 0; b < bees; ++b) {
        Solution cand = neighbor_solution(settings, site, patch, rng, max_move_attempts);
        out.evaluated++;
        if (cand.fuel() < best_fuel) {
            best_fuel = cand.fuel();
            out.best = std::move(cand);
            out.improved = true;
        }
    }
    return out;
}

}  // namespace

BeesOptimizer::BeesOptimizer(const ProblemSettings& settings, const BeesOptions& opt)
    : settings_(settings), opt_(opt) {
    validate_options();
}

void BeesOptimizer::validate_options() const {
    if (opt_.population_size <= 0) {
        throw ConfigurationError("population_size must be > 0");
    }
    if (opt_.num_elite_sites < 0 || opt_.num_best_sites < 0) {
        throw ConfigurationError("num_elite_sites and num_best_sites must be >= 0");
    }
    if (opt_.num_elite_sites + opt_.num_best_sites > opt_.population_size) {
        throw ConfigurationError("num_elite_sites + num_best_sites must be <= population_size");
    }
    if (opt_.elite_bees_count < 0 || opt_.best_bees_count < 0) {
        throw ConfigurationError("elite_bees_count and best_bees_count must be >= 0");
    }
    if (!(opt_.initial_patch_size > 0.0) || !std::isfinite(opt_.initial_patch_size)) {
        throw ConfigurationError("initial_patch_size must be > 0");
    }
    if (!(opt_.patch_decay_factor > 0.0 && opt_.patch_decay_factor <= 1.0)) {
        throw ConfigurationError("patch_decay_factor must be in (0,1]");
    }
    if (!(opt_.min_patch_size > 0.0) || !std::isfinite(opt_.min_patch_size)) {
        throw ConfigurationError("min_patch_size must be > 0");
    }
    if (opt_.stagnation_limit <= 0) {
        throw ConfigurationError("stagnation_limit must be > 0");
    }
    if (opt_.max_iterations < 0) {
        throw ConfigurationError("max_iterations must be >= 0");
    }
    if (opt_.early_stop_iterations < 0) {
        throw ConfigurationError("early_stop_iterations must be >= 0");
    }
    if (opt_.max_move_attempts <= 0) {
        throw ConfigurationError("max_move_attempts must be > 0");
    }
    if (opt_.threads < 0) {
        throw ConfigurationError("threads must be >= 0");
    }
    if (opt_.log_every < 0) {
        throw ConfigurationError("log_every must be >= 0");
    }
}

void BeesOptimizer::reset(std::uint64_t seed) {
    rng_.seed(seed);
    population_.clear();
    population_.reserve(static_cast<size_t>(opt_.population_size));
    for (int i = 0; i < opt_.population_size; ++i) {
        population_.push_back(BeesSite{generate_random_solution(settings_, rng_), 0});
    }

    stats_ = BeesResult{};
    const auto best_it = std::min_element(population_.begin(), population_.end(), [](const BeesSite& a, const BeesSite& b) {
        return a.solution.fuel() < b.solution.fuel();
    });
    stats_.best = best_it->solution;
    stats_.best_fuel = best_it->solution.fuel();
    stats_.init_fuel = stats_.best_fuel;
    stats_.scouts_spawned = opt_.population_size;

    patch_size_ = std::max(opt_.min_patch_size, opt_.initial_patch_size);
    since_improvement_ = 0;
    initialized_ = true;

    if (opt_.log_every > 0) {
        log_progress("start");
    }
}

bool BeesOptimizer::done() const {
    if (!initialized_) {
        return false;
    }
    if (stats_.iterations >= opt_.max_iterations) {
        return true;
    }
    return opt_.early_stop_iterations > 0 && since_improvement_ >= opt_.early_stop_iterations;
}

const Solution& BeesOptimizer::current_best() const {
    if (!initialized_) {
        throw std::logic_error("BeesOptimizer::current_best: reset() has not been called");
    }
    return stats_.best;
}

void BeesOptimizer::local_search() {
    const int searched = opt_.num_elite_sites + opt_.num_best_sites;
    if (searched == 0) {
        return;
    }

    const int patch = std::max(1, static_cast<int>(std::llround(patch_size_)));

    // Per-site seeds are drawn serially so the parallel loop below is reproducible.
    std::vector<std::uint64_t> seeds(static_cast<size_t>(searched));
    for (auto& s : seeds) {
        s = rng_();
    }

    std::vector<SiteOutcome> outcomes(static_cast<size_t>(searched));
    const int threads = (opt_.threads > 0) ? opt_.threads : omp_max_threads();
    (void)threads;

#pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (int i = 0; i < searched; ++i) {
        const int bees = (i < opt_.num_elite_sites) ? opt_.elite_bees_count : opt_.best_bees_count;
        try {
            outcomes[static_cast<size_t>(i)] = search_site(settings_,
                                                           population_[static_cast<size_t>(i)].solution,
                                                           bees,
                                                           patch,
                                                           opt_.max_move_attempts,
                                                           seeds[static_cast<size_t>(i)]);
        } catch (...) {
            outcomes[static_cast<size_t>(i)].error = std::current_exception();
        }
    }

    for (int i = 0; i < searched; ++i) {
        auto& out = outcomes[static_cast<size_t>(i)];
        if (out.error) {
            std::rethrow_exception(out.error);
        }
        stats_.neighbors_evaluated += out.evaluated;

        auto& site = population_[static_cast<size_t>(i)];
        if (out.improved) {
            site.solution = std::move(out.best);
            site.stagnation = 0;
            stats_.site_improvements++;
        } else {
            site.stagnation++;
        }

        if (site.stagnation >= opt_.stagnation_limit) {
            site.solution = generate_random_solution(settings_, rng_);
            site.stagnation = 0;
            stats_.sites_abandoned++;
        }
    }
}

double BeesOptimizer::step() {
    if (!initialized_) {
        throw std::logic_error("BeesOptimizer::step: reset() has not been called");
    }

    std::stable_sort(population_.begin(), population_.end(), [](const BeesSite& a, const BeesSite& b) {
        return a.solution.fuel() < b.solution.fuel();
    });

    local_search();

    const int searched = opt_.num_elite_sites + opt_.num_best_sites;
    for (int i = searched; i < opt_.population_size; ++i) {
        population_[static_cast<size_t>(i)] = BeesSite{generate_random_solution(settings_, rng_), 0};
        stats_.scouts_spawned++;
    }

    bool improved = false;
    for (const auto& site : population_) {
        if (site.solution.fuel() < stats_.best_fuel) {
            stats_.best = site.solution;
            stats_.best_fuel = site.solution.fuel();
            improved = true;
        }
    }
    since_improvement_ = improved ? 0 : since_improvement_ + 1;

    stats_.history.push_back(stats_.best_fuel);
    stats_.iterations++;
    patch_size_ = std::max(opt_.min_patch_size, patch_size_ * opt_.patch_decay_factor);
    stats_.final_patch_size = patch_size_;

    if (opt_.log_every > 0 && (stats_.iterations % opt_.log_every) == 0) {
        log_progress("it");
    }
    return stats_.best_fuel;
}

BeesResult BeesOptimizer::run(std::uint64_t seed) {
    reset(seed);
    while (!done()) {
        step();
    }
    stats_.stopped_early = stats_.iterations < opt_.max_iterations;
    stats_.final_patch_size = patch_size_;

    if (opt_.log_every > 0) {
        log_progress("done");
    }
    return stats_;
}

void BeesOptimizer::log_progress(const char* what) const {
    const std::string prefix = opt_.log_prefix.empty() ? std::string("[bees]") : opt_.log_prefix;
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << prefix << " " << what << " it=" << stats_.iterations << "/" << opt_.max_iterations
              << " rockets=" << settings_.num_rockets() << " modules=" << settings_.num_modules()
              << " patch=" << patch_size_ << " best_fuel=" << stats_.best_fuel
              << " neighbors=" << stats_.neighbors_evaluated << " improved=" << stats_.site_improvements
              << " abandoned=" << stats_.sites_abandoned << "\n";
}

}  // namespace rocketalloc
