#pragma once

#include "types.hpp"
#include <string>

namespace std_atmosphere {

/**
 * @brief Altitude inversions of the standard atmosphere
 *
 * All solvers run core::secant_solve against the forward model in English
 * units. A result that hit the iteration cap is still returned; pass a
 * SolveResult pointer to find out how the iteration ended.
 */

/**
 * @brief Altitude at which the atmosphere has a given density
 * @param density Density in density_units
 * @param density_units Density units; slug/ft^3, slinch/in^3, kg/m^3
 * @param alt_units Altitude units of the result; ft, m, kft
 * @param options Iteration settings
 * @param info Optional convergence report (altitude in ft)
 * @return Altitude in alt_units
 */
double altitude_for_density(double density, const std::string& density_units = "slug/ft^3",
                            const std::string& alt_units = "ft",
                            const SolverOptions& options = SolverOptions(),
                            SolveResult* info = nullptr);

/**
 * @brief Altitude at which the atmosphere has a given static pressure
 * @param pressure Pressure in pressure_units
 * @param pressure_units Pressure units; psf, psi, Pa
 * @param alt_units Altitude units of the result; ft, m, kft
 * @param options Iteration settings
 * @param info Optional convergence report (altitude in ft)
 * @return Altitude in alt_units
 */
double altitude_for_pressure(double pressure, const std::string& pressure_units = "psf",
                             const std::string& alt_units = "ft",
                             const SolverOptions& options = SolverOptions(),
                             SolveResult* info = nullptr);

/**
 * @brief Altitude giving a dynamic pressure at a fixed Mach number
 *
 * q is turned into the static pressure p = 2 q / (gamma M^2) and the pressure
 * profile is inverted.
 *
 * @param q Dynamic pressure in psf (Pa when SI)
 * @param mach Mach number to hold constant
 * @param SI Use Pa for q and m for the result
 * @return Altitude in ft (m when SI)
 */
double altitude_for_q_mach(double q, double mach, bool SI = false);

// A single unit token would otherwise convert to the SI flag
double altitude_for_q_mach(double q, double mach, const char* pressure_units) = delete;

/**
 * @brief Altitude giving a dynamic pressure at a fixed Mach number
 * @param q Dynamic pressure in pressure_units
 * @param mach Mach number to hold constant
 * @param pressure_units Pressure units; psf, psi, Pa
 * @param alt_units Altitude units of the result; ft, m, kft
 * @param options Iteration settings
 * @param info Optional convergence report (altitude in ft)
 * @return Altitude in alt_units
 */
double altitude_for_q_mach(double q, double mach, const std::string& pressure_units,
                           const std::string& alt_units,
                           const SolverOptions& options = SolverOptions(),
                           SolveResult* info = nullptr);

/**
 * @brief Altitude giving an equivalent airspeed at a fixed Mach number
 *
 * EAS depends on both temperature and pressure, so the EAS relation is
 * inverted directly.
 *
 * @param equivalent_airspeed EAS in velocity_units
 * @param mach Mach number to hold constant
 * @param velocity_units Velocity units; ft/s, m/s, in/s, knots
 * @param alt_units Altitude units of the result; ft, m, kft
 * @param options Iteration settings
 * @param info Optional convergence report (altitude in ft)
 * @return Altitude in alt_units
 */
double altitude_for_eas_mach(double equivalent_airspeed, double mach,
                             const std::string& velocity_units = "ft/s",
                             const std::string& alt_units = "ft",
                             const SolverOptions& options = SolverOptions(),
                             SolveResult* info = nullptr);

} // namespace std_atmosphere
