#pragma once

#include <stdexcept>
#include <string>

namespace rocketalloc {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed problem settings, optimizer options or problem file.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& msg) : Error(msg) {}
};

// Total rocket capacity is below the number of modules.
class InfeasibleProblemError : public Error {
public:
    explicit InfeasibleProblemError(const std::string& msg) : Error(msg) {}
};

// An allocation produced by the library broke a capacity or coverage invariant (a bug, not user input).
class AlgorithmInvariantError : public Error {
public:
    explicit AlgorithmInvariantError(const std::string& msg) : Error(msg) {}
};

}  // namespace rocketalloc
