#include "rocketalloc/problem_io.hpp"

#include <cstddef>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rocketalloc/errors.hpp"

namespace rocketalloc {
namespace {

std::string at_line(int line_no) {
    return "line " + std::to_string(line_no) + ": ";
}

int parse_int_token(const std::string& tok, int line_no) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(tok, &pos);
    } catch (const std::logic_error&) {
        throw ConfigurationError(at_line(line_no) + "invalid integer: " + tok);
    }
    if (pos != tok.size()) {
        throw ConfigurationError(at_line(line_no) + "invalid integer: " + tok);
    }
    return v;
}

double parse_double_token(const std::string& tok, int line_no) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(tok, &pos);
    } catch (const std::logic_error&) {
        throw ConfigurationError(at_line(line_no) + "invalid number: " + tok);
    }
    if (pos != tok.size()) {
        throw ConfigurationError(at_line(line_no) + "invalid number: " + tok);
    }
    return v;
}

std::vector<std::string> tokenize(const std::string& line) {
    std::string body = line;
    const size_t hash = body.find('#');
    if (hash != std::string::npos) {
        body.erase(hash);
    }
    std::vector<std::string> out;
    std::istringstream ss(body);
    std::string tok;
    while (ss >> tok) {
        out.push_back(tok);
    }
    return out;
}

}  // namespace

ProblemSettings read_problem(std::istream& in) {
    int num_rockets = 0;
    int num_modules = 0;
    bool have_rockets = false;
    bool have_modules = false;
    std::vector<int> capacities;
    std::vector<double> base_fuel;
    bool have_capacity = false;
    bool have_base_fuel = false;
    std::map<int, std::vector<double>> cost_rows;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        const auto tokens = tokenize(line);
        if (tokens.empty()) {
            continue;
        }
        const std::string& key = tokens[0];

        if (key == "rockets" || key == "modules") {
            if (tokens.size() != 2) {
                throw ConfigurationError(at_line(line_no) + key + " expects exactly one value");
            }
            bool& seen = (key == "rockets") ? have_rockets : have_modules;
            if (seen) {
                throw ConfigurationError(at_line(line_no) + "duplicate key: " + key);
            }
            ((key == "rockets") ? num_rockets : num_modules) = parse_int_token(tokens[1], line_no);
            seen = true;
        } else if (key == "capacity") {
            if (have_capacity) {
                throw ConfigurationError(at_line(line_no) + "duplicate key: capacity");
            }
            for (size_t i = 1; i < tokens.size(); ++i) {
                capacities.push_back(parse_int_token(tokens[i], line_no));
            }
            have_capacity = true;
        } else if (key == "base_fuel") {
            if (have_base_fuel) {
                throw ConfigurationError(at_line(line_no) + "duplicate key: base_fuel");
            }
            for (size_t i = 1; i < tokens.size(); ++i) {
                base_fuel.push_back(parse_double_token(tokens[i], line_no));
            }
            have_base_fuel = true;
        } else if (key == "cost") {
            if (tokens.size() < 2) {
                throw ConfigurationError(at_line(line_no) + "cost expects a rocket index");
            }
            const int r = parse_int_token(tokens[1], line_no);
            if (cost_rows.count(r) != 0) {
                throw ConfigurationError(at_line(line_no) + "duplicate cost row for rocket " + std::to_string(r));
            }
            std::vector<double> row;
            row.reserve(tokens.size() - 2);
            for (size_t i = 2; i < tokens.size(); ++i) {
                row.push_back(parse_double_token(tokens[i], line_no));
            }
            cost_rows.emplace(r, std::move(row));
        } else {
            throw ConfigurationError(at_line(line_no) + "unknown key: " + key);
        }
    }

    if (!have_rockets) {
        throw ConfigurationError("missing key: rockets");
    }
    if (!have_modules) {
        throw ConfigurationError("missing key: modules");
    }
    if (!have_capacity) {
        throw ConfigurationError("missing key: capacity");
    }
    if (!have_base_fuel) {
        throw ConfigurationError("missing key: base_fuel");
    }

    CostMatrix cost_matrix;
    for (const auto& [r, row] : cost_rows) {
        if (r < 0 || r >= num_rockets) {
            throw ConfigurationError("cost row for out-of-range rocket " + std::to_string(r));
        }
    }
    for (int r = 0; r < num_rockets; ++r) {
        auto it = cost_rows.find(r);
        if (it == cost_rows.end()) {
            throw ConfigurationError("missing cost row for rocket " + std::to_string(r));
        }
        cost_matrix.push_back(std::move(it->second));
    }

    return ProblemSettings(num_rockets, num_modules, std::move(capacities), std::move(base_fuel), std::move(cost_matrix));
}

void write_problem(std::ostream& out, const ProblemSettings& settings, int precision) {
    if (precision < 0 || precision > 17) {
        throw std::invalid_argument("write_problem: precision must be in [0,17]");
    }

    std::ostringstream oss;
    oss << std::setprecision(precision);
    oss << "rockets " << settings.num_rockets() << "\n";
    oss << "modules " << settings.num_modules() << "\n";
    oss << "capacity";
    for (int c : settings.capacities()) {
        oss << " " << c;
    }
    oss << "\nbase_fuel";
    for (double b : settings.base_fuels()) {
        oss << " " << b;
    }
    oss << "\n";
    for (int r = 0; r < settings.num_rockets(); ++r) {
        oss << "cost " << r;
        for (int m = 0; m < settings.num_modules(); ++m) {
            oss << " " << settings.cost(r, m);
        }
        oss << "\n";
    }
    out << oss.str();
}

}  // namespace rocketalloc
