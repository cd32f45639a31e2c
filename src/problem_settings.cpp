#include "rocketalloc/problem_settings.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

#include "rocketalloc/errors.hpp"

namespace rocketalloc {
namespace {

void require_non_negative(double v, const std::string& what) {
    if (!std::isfinite(v)) {
        throw ConfigurationError(what + " must be finite");
    }
    if (v < 0.0) {
        throw ConfigurationError(what + " must be >= 0");
    }
}

}  // namespace

ProblemSettings::ProblemSettings(int num_rockets,
                                 int num_modules,
                                 std::vector<int> capacities,
                                 std::vector<double> base_fuel,
                                 CostMatrix cost_matrix)
    : num_rockets_(num_rockets),
      num_modules_(num_modules),
      capacities_(std::move(capacities)),
      base_fuel_(std::move(base_fuel)),
      cost_matrix_(std::move(cost_matrix)) {
    validate();
    if (total_capacity() < static_cast<std::int64_t>(num_modules_)) {
        throw InfeasibleProblemError("total rocket capacity " + std::to_string(total_capacity()) +
                                     " cannot carry " + std::to_string(num_modules_) + " modules");
    }
}

void ProblemSettings::validate() const {
    if (num_rockets_ <= 0) {
        throw ConfigurationError("num_rockets must be > 0");
    }
    if (num_modules_ <= 0) {
        throw ConfigurationError("num_modules must be > 0");
    }
    if (static_cast<int>(capacities_.size()) != num_rockets_) {
        throw ConfigurationError("capacities has " + std::to_string(capacities_.size()) +
                                 " entries, expected num_rockets=" + std::to_string(num_rockets_));
    }
    if (static_cast<int>(base_fuel_.size()) != num_rockets_) {
        throw ConfigurationError("base_fuel has " + std::to_string(base_fuel_.size()) +
                                 " entries, expected num_rockets=" + std::to_string(num_rockets_));
    }
    if (static_cast<int>(cost_matrix_.size()) != num_rockets_) {
        throw ConfigurationError("cost_matrix has " + std::to_string(cost_matrix_.size()) +
                                 " rows, expected num_rockets=" + std::to_string(num_rockets_));
    }

    for (int r = 0; r < num_rockets_; ++r) {
        const std::string idx = "[" + std::to_string(r) + "]";
        if (capacities_[static_cast<size_t>(r)] < 0) {
            throw ConfigurationError("capacities" + idx + " must be >= 0");
        }
        require_non_negative(base_fuel_[static_cast<size_t>(r)], "base_fuel" + idx);

        const auto& row = cost_matrix_[static_cast<size_t>(r)];
        if (static_cast<int>(row.size()) != num_modules_) {
            throw ConfigurationError("cost_matrix" + idx + " has " + std::to_string(row.size()) +
                                     " entries, expected num_modules=" + std::to_string(num_modules_));
        }
        for (int m = 0; m < num_modules_; ++m) {
            require_non_negative(row[static_cast<size_t>(m)], "cost_matrix" + idx + "[" + std::to_string(m) + "]");
        }
    }
}

std::int64_t ProblemSettings::total_capacity() const {
    std::int64_t total = 0;
    for (int c : capacities_) {
        total += c;
    }
    return total;
}

}  // namespace rocketalloc
