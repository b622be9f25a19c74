#pragma once

#include "types.hpp"
#include <string>

namespace std_atmosphere {

/**
 * @brief Freestream temperature
 * @param alt Altitude in alt_units
 * @param alt_units Altitude units; ft, m, kft
 * @param temperature_units Temperature units; R, K
 * @return Temperature in temperature_units
 */
double compute_temperature(double alt, const std::string& alt_units = "ft",
                           const std::string& temperature_units = "R");

/**
 * @brief Freestream static pressure
 * @param alt Altitude in alt_units
 * @param alt_units Altitude units; ft, m, kft
 * @param pressure_units Pressure units; psf, psi, Pa
 * @return Pressure in pressure_units
 */
double compute_pressure(double alt, const std::string& alt_units = "ft",
                        const std::string& pressure_units = "psf");

/**
 * @brief Freestream density from the ideal-gas law, rho = p / (R T)
 * @param alt Altitude in alt_units
 * @param R Gas constant [ft*lbf/(slug*R)]
 * @param alt_units Altitude units; ft, m, kft
 * @param density_units Density units; slug/ft^3, slinch/in^3, kg/m^3
 * @return Density in density_units
 */
double compute_density(double alt, double R = kGasConstant, const std::string& alt_units = "ft",
                       const std::string& density_units = "slug/ft^3");

/**
 * @brief Speed of sound, a = sqrt(gamma R T)
 * @param alt Altitude in alt_units
 * @param alt_units Altitude units; ft, m, kft
 * @param velocity_units Velocity units; ft/s, m/s, in/s, knots
 * @param gamma Ratio of specific heats
 * @return Speed of sound in velocity_units
 */
double compute_speed_of_sound(double alt, const std::string& alt_units = "ft",
                              const std::string& velocity_units = "ft/s", double gamma = kGamma);

/**
 * @brief True airspeed at a Mach number, V = M a
 * @param alt Altitude in alt_units
 * @param mach Mach number
 * @param alt_units Altitude units; ft, m, kft
 * @param velocity_units Velocity units; ft/s, m/s, in/s, knots
 * @return Velocity in velocity_units
 */
double compute_velocity(double alt, double mach, const std::string& alt_units = "ft",
                        const std::string& velocity_units = "ft/s");

/**
 * @brief Mach number of a true airspeed, M = V / a
 * @param alt Altitude in alt_units
 * @param velocity Velocity in velocity_units
 * @param alt_units Altitude units; ft, m, kft
 * @param velocity_units Velocity units; ft/s, m/s, in/s, knots
 * @return Mach number
 */
double compute_mach_number(double alt, double velocity, const std::string& alt_units = "ft",
                           const std::string& velocity_units = "ft/s");

/**
 * @brief Evaluate the full thermodynamic state once
 * @param altitude_ft Altitude [ft]
 * @return State in English units
 */
AtmosphereState compute_state(double altitude_ft);

} // namespace std_atmosphere
