#pragma once

#include "physics/types.hpp"
#include <string>

namespace std_atmosphere {
namespace core {

// Probe-step secant iteration: find z with f(z) == target.
// Each step linearises f between z and z + options.step and jumps to the
// target along that line. Stops when two estimates differ by no more than
// options.tolerance or after options.max_iterations; the last estimate is
// returned either way and SolveResult::converged tells them apart. A zero or
// non-finite slope ends the iteration at the current estimate.
// f is assumed monotonic over the region the iteration visits.
SolveResult secant_solve(
    const AltitudeFunc &f,
    double target,
    const SolverOptions &options = SolverOptions(),
    const std::string &quantity = "value"
);

} // namespace core
} // namespace std_atmosphere
