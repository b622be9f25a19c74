#include "physics/core/root_finding.hpp"
#include "physics/utils.hpp"
#include <cmath>

namespace std_atmosphere {
namespace core {

SolveResult secant_solve(
    const AltitudeFunc &f,
    double target,
    const SolverOptions &options,
    const std::string &quantity
) {
    options.validate();

    SolveResult result;
    double z_old = options.previous_guess;
    double z = options.initial_guess;
    int n = 0;
    bool stalled = false;

    while (std::abs(z - z_old) > options.tolerance && n < options.max_iterations) {
        z_old = z;
        double f1 = f(z_old);
        double f2 = f(z_old + options.step);
        double df = f2 - f1;
        if (df == 0.0 || !std::isfinite(df)) {
            logging::get_logger()->warn(
                "altitude for {} - probe slope is {} at z={} ft; returning current estimate",
                quantity, df, z_old);
            stalled = true;
            break;
        }

        double m = options.step / df;
        double z_new = m * (target - f1) + z_old;
        ++n;
        if (!std::isfinite(z_new)) {
            logging::get_logger()->warn(
                "altitude for {} - non-finite estimate for target {}; returning z={} ft",
                quantity, target, z_old);
            stalled = true;
            break;
        }
        z = z_new;
    }

    if (n > options.warn_iterations) {
        logging::get_logger()->warn("altitude for {} - n = {} (cap {})", quantity, n,
                                    options.max_iterations);
    }

    result.altitude = z;
    result.iterations = n;
    result.converged = !stalled && std::abs(z - z_old) <= options.tolerance;
    return result;
}

} // namespace core
} // namespace std_atmosphere
