#pragma once

#include <stdexcept>
#include <string>

namespace std_atmosphere {

/**
 * @brief Unit conversion utilities
 *
 * Every dimension has a canonical English unit; conversions build a single
 * multiplicative factor (input unit to canonical, canonical to output unit).
 * Temperature is converted as a pure scale since only absolute scales
 * (Rankine, Kelvin) are supported.
 *
 * | dimension           | canonical     | accepted                          |
 * |---------------------|---------------|-----------------------------------|
 * | altitude            | ft            | ft, m, kft                        |
 * | velocity            | ft/s          | ft/s, m/s, in/s, knots            |
 * | pressure            | psf           | psf, psi, Pa                      |
 * | density             | slug/ft^3     | slug/ft^3, slinch/in^3, kg/m^3    |
 * | temperature         | R             | R, K                              |
 * | dynamic viscosity   | (lbf*s)/ft^2  | (lbf*s)/ft^2, (N*s)/m^2, Pa*s     |
 * | kinematic viscosity | ft^2/s        | ft^2/s, m^2/s                     |
 * | unit Reynolds       | 1/ft          | 1/ft, 1/m                         |
 */
namespace units {

    /**
     * @brief Raised when a unit token is not supported for its dimension
     */
    class InvalidUnitError : public std::invalid_argument {
    public:
        /**
         * @brief Constructor
         * @param dimension Dimension name (e.g. "pressure")
         * @param unit Offending unit token
         * @param accepted Human readable list of accepted tokens
         */
        InvalidUnitError(const std::string& dimension, const std::string& unit,
                         const std::string& accepted);

        const std::string& dimension() const { return dimension_; }
        const std::string& unit() const { return unit_; }

    private:
        std::string dimension_;
        std::string unit_;
    };

    /**
     * @brief Convert an altitude/length
     * @param alt Altitude in alt_units_in
     * @param alt_units_in Input units; ft, m, kft
     * @param alt_units_out Output units; ft, m, kft
     * @return Altitude in alt_units_out
     */
    double convert_altitude(double alt, const std::string& alt_units_in,
                            const std::string& alt_units_out);

    /**
     * @brief Convert a velocity
     * @param velocity Velocity in velocity_units_in
     * @param velocity_units_in Input units; ft/s, m/s, in/s, knots
     * @param velocity_units_out Output units; ft/s, m/s, in/s, knots
     * @return Velocity in velocity_units_out
     */
    double convert_velocity(double velocity, const std::string& velocity_units_in,
                            const std::string& velocity_units_out);

    /**
     * @brief Convert a pressure
     * @param pressure Pressure in pressure_units_in
     * @param pressure_units_in Input units; psf, psi, Pa
     * @param pressure_units_out Output units; psf, psi, Pa
     * @return Pressure in pressure_units_out
     */
    double convert_pressure(double pressure, const std::string& pressure_units_in,
                            const std::string& pressure_units_out);

    /**
     * @brief Convert a density
     * @param density Density in density_units_in
     * @param density_units_in Input units; slug/ft^3, slinch/in^3, kg/m^3
     * @param density_units_out Output units; slug/ft^3, slinch/in^3, kg/m^3
     * @return Density in density_units_out
     */
    double convert_density(double density, const std::string& density_units_in,
                           const std::string& density_units_out);

    /**
     * @brief Convert an absolute temperature
     * @param temperature Temperature in temperature_units_in
     * @param temperature_units_in Input units; R, K
     * @param temperature_units_out Output units; R, K
     * @return Temperature in temperature_units_out
     */
    double convert_temperature(double temperature, const std::string& temperature_units_in,
                               const std::string& temperature_units_out);

    double convert_dynamic_viscosity(double mu, const std::string& visc_units_in,
                                     const std::string& visc_units_out);

    double convert_kinematic_viscosity(double nu, const std::string& visc_units_in,
                                       const std::string& visc_units_out);

    // Reynolds number per unit length; 1/ft, 1/m
    double convert_unit_reynolds(double reynolds, const std::string& units_in,
                                 const std::string& units_out);

    /**
     * @brief Throw InvalidUnitError unless the token is valid for the dimension
     * @param dimension One of altitude, velocity, pressure, density, temperature,
     *                  dynamic viscosity, kinematic viscosity, unit Reynolds number
     * @param unit Unit token
     */
    void require_unit(const std::string& dimension, const std::string& unit);
}

/**
 * @brief One unit token per dimension
 *
 * Entry points with an SI flag pick one of the presets below.
 */
struct UnitSet {
    std::string altitude;
    std::string velocity;
    std::string pressure;
    std::string density;
    std::string temperature;
    std::string dynamic_viscosity;
    std::string kinematic_viscosity;
    std::string unit_reynolds;

    // Default constructor (English units)
    UnitSet() : altitude("ft"), velocity("ft/s"), pressure("psf"), density("slug/ft^3"),
                temperature("R"), dynamic_viscosity("(lbf*s)/ft^2"),
                kinematic_viscosity("ft^2/s"), unit_reynolds("1/ft") {}

    static UnitSet english() { return UnitSet(); }

    static UnitSet si() {
        UnitSet set;
        set.altitude = "m";
        set.velocity = "m/s";
        set.pressure = "Pa";
        set.density = "kg/m^3";
        set.temperature = "K";
        set.dynamic_viscosity = "Pa*s";
        set.kinematic_viscosity = "m^2/s";
        set.unit_reynolds = "1/m";
        return set;
    }

    static UnitSet fromFlag(bool SI) { return SI ? si() : english(); }

    // Throws units::InvalidUnitError on the first unsupported token
    void validate() const;
};

} // namespace std_atmosphere
