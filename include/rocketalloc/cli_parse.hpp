#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rocketalloc {

// Argument parsing helpers for the rocket_opt driver. Every failure is a std::runtime_error whose
// message names the offending text, so `main` can print it after "error: ".

inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(flag + " expects a value");
    }
    return argv[++i];
}

namespace detail {

// Runs a std::sto* style conversion and insists it consumes the whole string.
template <typename T, typename Convert>
T parse_whole(const std::string& s, const char* what, Convert convert) {
    size_t pos = 0;
    T v{};
    try {
        v = convert(s, &pos);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error(std::string("invalid ") + what + ": '" + s + "'");
    } catch (const std::out_of_range&) {
        throw std::runtime_error(std::string(what) + " out of range: '" + s + "'");
    }
    if (pos != s.size()) {
        throw std::runtime_error(std::string("invalid ") + what + ": '" + s + "'");
    }
    return v;
}

}  // namespace detail

inline int parse_int(const std::string& s) {
    return detail::parse_whole<int>(s, "integer", [](const std::string& t, size_t* pos) {
        return std::stoi(t, pos);
    });
}

// std::stoull accepts "-1" and wraps it; seeds must be written as non-negative numbers.
inline std::uint64_t parse_u64(const std::string& s) {
    if (s.find('-') != std::string::npos) {
        throw std::runtime_error("invalid unsigned integer: '" + s + "'");
    }
    return detail::parse_whole<std::uint64_t>(s, "unsigned integer", [](const std::string& t, size_t* pos) {
        return static_cast<std::uint64_t>(std::stoull(t, pos));
    });
}

// Rejects nan and inf: option checks written as `x <= 0` would let nan through.
inline double parse_double(const std::string& s) {
    const double v = detail::parse_whole<double>(s, "number", [](const std::string& t, size_t* pos) {
        return std::stod(t, pos);
    });
    if (!std::isfinite(v)) {
        throw std::runtime_error("number must be finite: '" + s + "'");
    }
    return v;
}

// "0,1,0,1" -> {0, 1, 0, 1}; empty items are skipped.
inline std::vector<int> parse_int_list(const std::string& s) {
    std::vector<int> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        out.push_back(parse_int(item));
    }
    return out;
}

// Reads the value after `flag` and parses it, prefixing any error with the flag name.
template <typename Parse>
auto flag_value(int& i, int argc, char** argv, const std::string& flag, Parse parse) -> decltype(parse(std::string())) {
    const std::string value = require_arg(i, argc, argv, flag);
    try {
        return parse(value);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(flag + ": " + e.what());
    }
}

inline int int_arg(int& i, int argc, char** argv, const std::string& flag) {
    return flag_value(i, argc, argv, flag, parse_int);
}

inline std::uint64_t u64_arg(int& i, int argc, char** argv, const std::string& flag) {
    return flag_value(i, argc, argv, flag, parse_u64);
}

inline double double_arg(int& i, int argc, char** argv, const std::string& flag) {
    return flag_value(i, argc, argv, flag, parse_double);
}

inline std::vector<int> int_list_arg(int& i, int argc, char** argv, const std::string& flag) {
    return flag_value(i, argc, argv, flag, parse_int_list);
}

}  // namespace rocketalloc
