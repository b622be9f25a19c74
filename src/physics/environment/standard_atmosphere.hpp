#pragma once

#include <cstddef>
#include <vector>

namespace std_atmosphere {
namespace environment {

enum class TemperatureLaw {
    Constant,   // T = T_base
    Linear      // T = T_base + slope * (z - z_base)
};

enum class PressureLaw {
    Linear,     // lnP = a + b * (z - z_base)
    Logarithmic // lnP = a + b * ln(1 + c * (z - z_base))
};

/**
 * @brief One band of the piecewise atmosphere (English units)
 *
 * Altitudes are in feet, temperatures in Rankine and pressures in psf.
 */
struct AtmosphereLayer {
    double base_altitude;       // ft, inclusive
    double top_altitude;        // ft, exclusive
    TemperatureLaw temperature_law;
    double base_temperature;    // R
    double lapse_rate;          // R/ft
    PressureLaw pressure_law;
    double log_pressure_base;   // a
    double log_pressure_slope;  // b
    double log_pressure_scale;  // c, Logarithmic law only

    /**
     * @brief Evaluate this layer's temperature law
     * @param altitude_ft Altitude [ft]
     * @return Temperature [R]
     */
    double temperature(double altitude_ft) const;

    /**
     * @brief Evaluate this layer's pressure law
     * @param altitude_ft Altitude [ft]
     * @return Natural log of pressure [ln(psf)]
     */
    double log_pressure(double altitude_ft) const;
};

/**
 * @brief 1976-style standard atmosphere valid to ~300 kft
 *
 * From the Bell Handbook of Aerodynamic Heating, Table C.1. Above the top
 * breakpoint the last layer is extrapolated; below sea level the first layer
 * is extrapolated. Neither case is an error.
 */
class StandardAtmosphere {
public:
    /**
     * @brief Base temperature at altitude
     * @param altitude_ft Altitude [ft]
     * @return Temperature [R]
     */
    static double temperature(double altitude_ft);

    /**
     * @brief Static pressure at altitude
     * @param altitude_ft Altitude [ft]
     * @return Pressure [psf]
     */
    static double pressure(double altitude_ft);

    /**
     * @brief Index of the layer whose formulas apply at an altitude
     * @param altitude_ft Altitude [ft]
     * @return 0 for sea level and below up to layers().size() - 1 above the top
     */
    static std::size_t layer_index(double altitude_ft);

    static const std::vector<AtmosphereLayer>& layers() { return kLayers; }

    // Highest altitude covered by the table [ft]
    static double top_altitude() { return kLayers.back().top_altitude; }

    static bool is_extrapolated(double altitude_ft) {
        return altitude_ft < 0.0 || altitude_ft >= top_altitude();
    }

private:
    static const std::vector<AtmosphereLayer> kLayers;
};

} // namespace environment
} // namespace std_atmosphere
