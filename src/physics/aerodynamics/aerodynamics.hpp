#pragma once

#include <string>

namespace std_atmosphere {
namespace aerodynamics {

// Sutherland's law for air, Bertin (Aerodynamics for Engineers) eq. 1.5b.
// T in Rankine, returns dynamic viscosity in (lbf*s)/ft^2. Linear below 225 R;
// warns (does not throw) above 5400 R where the law is not validated.
double sutherland_viscosity(double T);

/**
 * @brief Freestream dynamic pressure, q = gamma/2 p M^2
 * @param alt Altitude in alt_units
 * @param mach Mach number
 * @param alt_units Altitude units; ft, m, kft
 * @param pressure_units Pressure units; psf, psi, Pa
 * @return Dynamic pressure in pressure_units
 */
double compute_dynamic_pressure(double alt, double mach, const std::string& alt_units = "ft",
                                const std::string& pressure_units = "psf");

/**
 * @brief Equivalent airspeed, EAS = TAS sqrt(rho / rho0) = a M sqrt(p T0 / (T p0))
 * @param alt Altitude in alt_units
 * @param mach Mach number
 * @param alt_units Altitude units; ft, m, kft
 * @param eas_units Velocity units; ft/s, m/s, in/s, knots
 * @return Equivalent airspeed in eas_units
 */
double compute_equivalent_airspeed(double alt, double mach, const std::string& alt_units = "ft",
                                   const std::string& eas_units = "ft/s");

/**
 * @brief Freestream dynamic viscosity from Sutherland's law
 * @param alt Altitude in alt_units
 * @param alt_units Altitude units; ft, m, kft
 * @param visc_units Viscosity units; (lbf*s)/ft^2, (N*s)/m^2, Pa*s
 * @return Dynamic viscosity in visc_units
 */
double compute_dynamic_viscosity(double alt, const std::string& alt_units = "ft",
                                 const std::string& visc_units = "(lbf*s)/ft^2");

/**
 * @brief Freestream kinematic viscosity, nu = mu / rho
 * @param alt Altitude in alt_units
 * @param alt_units Altitude units; ft, m, kft
 * @param visc_units Kinematic viscosity units; ft^2/s, m^2/s
 * @return Kinematic viscosity in visc_units
 */
double compute_kinematic_viscosity(double alt, const std::string& alt_units = "ft",
                                   const std::string& visc_units = "ft^2/s");

/**
 * @brief Reynolds number per unit length, Re_L = p M a / (mu R T)
 *
 * Evaluates pressure and temperature once and builds the result from them.
 *
 * @param alt Altitude in alt_units
 * @param mach Mach number
 * @param alt_units Altitude units; ft, m, kft
 * @param reynolds_units Units; 1/ft, 1/m
 * @return Unit Reynolds number in reynolds_units
 */
double compute_unit_reynolds_number(double alt, double mach, const std::string& alt_units = "ft",
                                    const std::string& reynolds_units = "1/ft");

/**
 * @brief Reynolds number per unit length, Re_L = rho V / mu
 *
 * Composed from the density, velocity and viscosity entry points.
 *
 * @param alt Altitude in ft, or m when SI is set
 * @param mach Mach number
 * @param SI Use m for altitude and 1/m for the result
 * @return Unit Reynolds number in 1/ft (1/m when SI)
 */
double compute_unit_reynolds_number_from_properties(double alt, double mach, bool SI = false);

// A unit token would otherwise convert to the SI flag
double compute_unit_reynolds_number_from_properties(double alt, double mach,
                                                    const char* alt_units) = delete;

} // namespace aerodynamics
} // namespace std_atmosphere
