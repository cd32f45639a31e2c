#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rocketalloc {

// cost_matrix[r][m] = variable fuel for carrying module m on rocket r.
using CostMatrix = std::vector<std::vector<double>>;

class ProblemSettings {
public:
    // Throws ConfigurationError on malformed input and InfeasibleProblemError when
    // total_capacity() < num_modules.
    ProblemSettings(int num_rockets,
                    int num_modules,
                    std::vector<int> capacities,
                    std::vector<double> base_fuel,
                    CostMatrix cost_matrix);

    void validate() const;
    std::int64_t total_capacity() const;

    int num_rockets() const { return num_rockets_; }
    int num_modules() const { return num_modules_; }

    int capacity(int rocket) const { return capacities_[static_cast<size_t>(rocket)]; }
    double base_fuel(int rocket) const { return base_fuel_[static_cast<size_t>(rocket)]; }
    double cost(int rocket, int module) const {
        return cost_matrix_[static_cast<size_t>(rocket)][static_cast<size_t>(module)];
    }

    const std::vector<int>& capacities() const { return capacities_; }
    const std::vector<double>& base_fuels() const { return base_fuel_; }
    const CostMatrix& cost_matrix() const { return cost_matrix_; }

private:
    int num_rockets_ = 0;
    int num_modules_ = 0;
    std::vector<int> capacities_;
    std::vector<double> base_fuel_;
    CostMatrix cost_matrix_;
};

}  // namespace rocketalloc
