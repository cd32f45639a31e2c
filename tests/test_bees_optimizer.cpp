#include <catch2/catch.hpp>

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "rocketalloc/bees_optimizer.hpp"
#include "rocketalloc/errors.hpp"
#include "test_helpers.hpp"

using rocketalloc::BeesOptimizer;
using rocketalloc::BeesOptions;
using rocketalloc::BeesResult;

namespace {

BeesOptions small_options() {
    BeesOptions opt;
    opt.population_size = 10;
    opt.max_iterations = 20;
    return opt;
}

void require_non_increasing(const std::vector<double>& history) {
    for (size_t i = 1; i < history.size(); ++i) {
        REQUIRE(history[i] <= history[i - 1]);
    }
}

}  // namespace

TEST_CASE("bees optimizer reaches the exhaustive minimum on a small instance", "[bees]") {
    const auto s = rocketalloc::test::small_problem();
    const double optimum = rocketalloc::test::brute_force_min_fuel(s);
    REQUIRE(optimum == Approx(21.0));

    BeesOptimizer optimizer(s, small_options());
    const BeesResult res = optimizer.run(42);

    CHECK(res.best_fuel == Approx(optimum));
    CHECK(res.best.feasible());
    CHECK(res.best.fuel() == res.best_fuel);
    CHECK(res.iterations == 20);
    CHECK_FALSE(res.stopped_early);
}

TEST_CASE("same seed and settings reproduce the run exactly", "[bees]") {
    const auto s = rocketalloc::test::medium_problem();
    BeesOptions opt;
    opt.max_iterations = 60;

    BeesOptimizer a(s, opt);
    BeesOptimizer b(s, opt);
    const BeesResult ra = a.run(123);
    const BeesResult rb = b.run(123);
    // Re-running the same optimizer instance must not leak state from the previous run.
    const BeesResult rc = a.run(123);

    CHECK(ra.best.allocation() == rb.best.allocation());
    CHECK(ra.best_fuel == rb.best_fuel);
    CHECK(ra.history == rb.history);
    CHECK(ra.neighbors_evaluated == rb.neighbors_evaluated);
    CHECK(ra.history == rc.history);
    CHECK(ra.best.allocation() == rc.best.allocation());
}

TEST_CASE("results do not depend on the local-search thread count", "[bees]") {
    const auto s = rocketalloc::test::medium_problem();
    BeesOptions opt;
    opt.max_iterations = 40;

    opt.threads = 1;
    const BeesResult serial = BeesOptimizer(s, opt).run(7);
    opt.threads = 4;
    const BeesResult parallel = BeesOptimizer(s, opt).run(7);

    CHECK(serial.best.allocation() == parallel.best.allocation());
    CHECK(serial.history == parallel.history);
    CHECK(serial.site_improvements == parallel.site_improvements);
}

TEST_CASE("global best fuel never increases", "[bees]") {
    const auto s = rocketalloc::test::medium_problem();
    BeesOptions opt;
    opt.max_iterations = 100;
    opt.stagnation_limit = 3;

    const BeesResult res = BeesOptimizer(s, opt).run(99);
    REQUIRE(res.history.size() == 100);
    require_non_increasing(res.history);
    CHECK(res.best_fuel <= res.init_fuel);
    CHECK(res.history.back() == res.best_fuel);
    CHECK(rocketalloc::is_feasible(s, res.best.allocation()));
}

TEST_CASE("zero iterations return the best scout", "[bees]") {
    const auto s = rocketalloc::test::small_problem();
    BeesOptions opt = small_options();
    opt.max_iterations = 0;

    const BeesResult res = BeesOptimizer(s, opt).run(1);
    CHECK(res.history.empty());
    CHECK(res.iterations == 0);
    CHECK(res.best_fuel == res.init_fuel);
    CHECK(res.best.feasible());
}

TEST_CASE("early stop ends the run after a quiet streak", "[bees]") {
    // The tight instance has only 60 feasible allocations, so the global best settles quickly.
    const auto s = rocketalloc::test::tight_problem();
    BeesOptions opt;
    opt.max_iterations = 100000;
    opt.early_stop_iterations = 5;

    const BeesResult res = BeesOptimizer(s, opt).run(3);
    CHECK(res.stopped_early);
    CHECK(res.iterations < 100000);
    CHECK(res.iterations >= 5);
    REQUIRE(res.history.size() >= 5);
    const auto n = res.history.size();
    CHECK(res.history[n - 1] == res.history[n - 5]);
}

TEST_CASE("local search improves sites when every rocket is full", "[bees]") {
    const rocketalloc::ProblemSettings s(2, 4, {2, 2}, {0.0, 0.0}, {{9.0, 1.0, 1.0, 9.0}, {1.0, 9.0, 9.0, 1.0}});
    BeesOptions opt;
    opt.population_size = 6;
    opt.max_iterations = 60;

    const BeesResult res = BeesOptimizer(s, opt).run(21);
    CHECK(res.site_improvements > 0);
    CHECK(res.best_fuel == Approx(4.0));
    CHECK(res.best.allocation() == rocketalloc::Allocation{1, 0, 0, 1});
}

TEST_CASE("stagnant sites are abandoned and scouts refreshed", "[bees]") {
    const auto s = rocketalloc::test::medium_problem();
    BeesOptions opt;
    opt.population_size = 8;
    opt.num_elite_sites = 2;
    opt.num_best_sites = 2;
    opt.elite_bees_count = 0;
    opt.best_bees_count = 0;
    opt.stagnation_limit = 1;
    opt.max_iterations = 10;

    const BeesResult res = BeesOptimizer(s, opt).run(5);
    // Without bees no site improves, so every searched site is abandoned every iteration.
    CHECK(res.neighbors_evaluated == 0);
    CHECK(res.site_improvements == 0);
    CHECK(res.sites_abandoned == 4 * 10);
    CHECK(res.scouts_spawned == 8 + 4 * 10);
}

TEST_CASE("patch size decays to its floor", "[bees]") {
    const auto s = rocketalloc::test::medium_problem();
    BeesOptions opt;
    opt.initial_patch_size = 6.0;
    opt.patch_decay_factor = 0.5;
    opt.min_patch_size = 1.5;
    opt.max_iterations = 10;

    BeesOptimizer optimizer(s, opt);
    optimizer.reset(1);
    CHECK(optimizer.patch_size() == Approx(6.0));
    optimizer.step();
    CHECK(optimizer.patch_size() == Approx(3.0));
    optimizer.step();
    CHECK(optimizer.patch_size() == Approx(1.5));
    optimizer.step();
    CHECK(optimizer.patch_size() == Approx(1.5));
}

TEST_CASE("step-wise driving matches run", "[bees]") {
    const auto s = rocketalloc::test::medium_problem();
    BeesOptions opt;
    opt.max_iterations = 25;

    BeesOptimizer stepped(s, opt);
    stepped.reset(31);
    REQUIRE(stepped.population().size() == static_cast<size_t>(opt.population_size));
    std::vector<double> fuels;
    while (!stepped.done()) {
        fuels.push_back(stepped.step());
    }

    const BeesResult res = BeesOptimizer(s, opt).run(31);
    CHECK(fuels == res.history);
    CHECK(stepped.current_best().allocation() == res.best.allocation());
}

TEST_CASE("population members stay feasible across steps", "[bees]") {
    const auto s = rocketalloc::test::medium_problem();
    BeesOptions opt;
    BeesOptimizer optimizer(s, opt);
    optimizer.reset(17);
    for (int i = 0; i < 15; ++i) {
        optimizer.step();
        for (const auto& site : optimizer.population()) {
            REQUIRE(site.solution.feasible());
            REQUIRE(site.stagnation < opt.stagnation_limit);
        }
        REQUIRE(optimizer.current_best().fuel() == optimizer.stats().best_fuel);
    }
}

TEST_CASE("stepping before reset is a logic error", "[bees]") {
    const auto s = rocketalloc::test::small_problem();
    BeesOptimizer optimizer(s, small_options());
    CHECK_THROWS_AS(optimizer.step(), std::logic_error);
    CHECK_THROWS_AS(optimizer.current_best(), std::logic_error);
}

TEST_CASE("invalid options are configuration errors", "[bees]") {
    const auto s = rocketalloc::test::small_problem();
    auto rejects = [&](BeesOptions opt) {
        CHECK_THROWS_AS(BeesOptimizer(s, opt), rocketalloc::ConfigurationError);
    };

    BeesOptions opt;
    opt.population_size = 0;
    rejects(opt);

    opt = BeesOptions{};
    opt.population_size = 5;
    opt.num_elite_sites = 3;
    opt.num_best_sites = 3;
    rejects(opt);

    opt = BeesOptions{};
    opt.patch_decay_factor = 0.0;
    rejects(opt);

    opt = BeesOptions{};
    opt.patch_decay_factor = 1.5;
    rejects(opt);

    opt = BeesOptions{};
    opt.initial_patch_size = -1.0;
    rejects(opt);

    opt = BeesOptions{};
    opt.stagnation_limit = 0;
    rejects(opt);

    opt = BeesOptions{};
    opt.max_iterations = -1;
    rejects(opt);

    opt = BeesOptions{};
    opt.elite_bees_count = -2;
    rejects(opt);

    opt = BeesOptions{};
    opt.max_move_attempts = 0;
    rejects(opt);

    opt = BeesOptions{};
    opt.patch_decay_factor = 1.0;
    CHECK_NOTHROW(BeesOptimizer(s, opt));
}

TEST_CASE("infeasible problems never reach the optimizer", "[bees]") {
    CHECK_THROWS_AS(rocketalloc::ProblemSettings(2, 3, {1, 1}, {1.0, 1.0}, {{1.0, 1.0, 1.0}, {1.0, 1.0, 1.0}}),
                    rocketalloc::InfeasibleProblemError);
}
