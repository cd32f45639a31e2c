#pragma once

#include <istream>
#include <ostream>

#include "rocketalloc/problem_settings.hpp"

namespace rocketalloc {

// Line-oriented problem text ('#' starts a comment, blank lines ignored):
//
//   rockets <R>
//   modules <M>
//   capacity <c_0> ... <c_{R-1}>
//   base_fuel <b_0> ... <b_{R-1}>
//   cost <r> <cost(r,0)> ... <cost(r,M-1)>   (one line per rocket)
//
// Throws ConfigurationError (with the line number) on malformed text; validation and
// infeasibility errors of ProblemSettings propagate unchanged.
ProblemSettings read_problem(std::istream& in);

void write_problem(std::ostream& out, const ProblemSettings& settings, int precision = 17);

}  // namespace rocketalloc
