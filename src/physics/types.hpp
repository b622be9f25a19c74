#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <functional>
#include <stdexcept>

namespace std_atmosphere {

// Forward declarations
using VecX = Eigen::VectorXd;
using MatX = Eigen::MatrixXd;

/**
 * @brief Physical constants for air in English units
 */
constexpr double kGasConstant = 1716.0;          // Gas constant for air [ft*lbf/(slug*R)]
constexpr double kGamma = 1.4;                   // Ratio of specific heats
constexpr double kSutherlandLinearLimit = 225.0; // Below this Sutherland's law is linearised [R]
constexpr double kSutherlandValidLimit = 5400.0; // Sutherland's law is not validated above [R]
constexpr double kSeaLevelAltitude = 0.0;        // Reference altitude for EAS [ft]

/**
 * @brief Thermodynamic state at one altitude (English units)
 */
struct AtmosphereState {
    double altitude;        // [ft]
    double temperature;     // [R]
    double pressure;        // [psf]
    double density;         // [slug/ft^3]
    double speed_of_sound;  // [ft/s]
    double viscosity;       // Dynamic viscosity, Sutherland [(lbf*s)/ft^2]

    // Default constructor
    AtmosphereState() : altitude(0.0), temperature(0.0), pressure(0.0), density(0.0),
                        speed_of_sound(0.0), viscosity(0.0) {}
};

/**
 * @brief Settings for the probe-step secant iteration
 *
 * The defaults reproduce the classic altitude inversion: start from the pair
 * (0 ft, 5000 ft), probe 500 ft above the estimate, stop when two estimates
 * are within 5 ft or after 20 iterations.
 */
struct SolverOptions {
    double previous_guess;      // Estimate seeded as the "old" value [ft]
    double initial_guess;       // First estimate [ft]
    double step;                // Probe step used for the local slope [ft]
    double tolerance;           // Convergence tolerance on successive estimates [ft]
    int max_iterations;         // Iteration cap
    int warn_iterations;        // Log a warning when more iterations than this are used

    // Default constructor
    SolverOptions() : previous_guess(0.0), initial_guess(5000.0), step(500.0), tolerance(5.0),
                      max_iterations(20), warn_iterations(18) {}

    // Throws std::invalid_argument on a non-positive step, tolerance or cap,
    // or on a starting pair that already satisfies the tolerance
    void validate() const {
        if (!(step > 0.0)) {
            throw std::invalid_argument("SolverOptions step must be positive");
        }
        if (!(tolerance > 0.0)) {
            throw std::invalid_argument("SolverOptions tolerance must be positive");
        }
        if (max_iterations <= 0) {
            throw std::invalid_argument("SolverOptions max_iterations must be positive");
        }
        if (!(std::abs(initial_guess - previous_guess) > tolerance)) {
            throw std::invalid_argument(
                "SolverOptions initial_guess must differ from previous_guess by more than tolerance");
        }
    }
};

/**
 * @brief Outcome of an altitude inversion
 */
struct SolveResult {
    double altitude;        // Final estimate [ft]
    int iterations;         // Iterations performed
    bool converged;         // True when successive estimates met the tolerance

    // Default constructor
    SolveResult() : altitude(0.0), iterations(0), converged(false) {}

    // Reset all values
    void reset() {
        altitude = 0.0;
        iterations = 0;
        converged = false;
    }
};

/**
 * @brief Scalar forward model evaluated at an altitude in feet
 */
using AltitudeFunc = std::function<double(double)>;

} // namespace std_atmosphere
