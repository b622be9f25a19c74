#include "atmosphere.hpp"
#include "aerodynamics/aerodynamics.hpp"
#include "environment/standard_atmosphere.hpp"
#include "units.hpp"
#include <cmath>

namespace std_atmosphere {

using environment::StandardAtmosphere;

double compute_temperature(double alt, const std::string& alt_units,
                           const std::string& temperature_units) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double T = StandardAtmosphere::temperature(z);
    return units::convert_temperature(T, "R", temperature_units);
}

double compute_pressure(double alt, const std::string& alt_units,
                        const std::string& pressure_units) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double p = StandardAtmosphere::pressure(z);
    return units::convert_pressure(p, "psf", pressure_units);
}

double compute_density(double alt, double R, const std::string& alt_units,
                       const std::string& density_units) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double p = StandardAtmosphere::pressure(z);
    double T = StandardAtmosphere::temperature(z);

    double rho = p / (R * T);
    return units::convert_density(rho, "slug/ft^3", density_units);
}

double compute_speed_of_sound(double alt, const std::string& alt_units,
                              const std::string& velocity_units, double gamma) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double T = StandardAtmosphere::temperature(z);

    double a = std::sqrt(gamma * kGasConstant * T);
    return units::convert_velocity(a, "ft/s", velocity_units);
}

double compute_velocity(double alt, double mach, const std::string& alt_units,
                        const std::string& velocity_units) {
    double a = compute_speed_of_sound(alt, alt_units, velocity_units);
    return mach * a;
}

double compute_mach_number(double alt, double velocity, const std::string& alt_units,
                           const std::string& velocity_units) {
    double a = compute_speed_of_sound(alt, alt_units, velocity_units);
    return velocity / a;
}

AtmosphereState compute_state(double altitude_ft) {
    AtmosphereState out;
    double T = StandardAtmosphere::temperature(altitude_ft);
    double p = StandardAtmosphere::pressure(altitude_ft);

    out.altitude = altitude_ft;
    out.temperature = T;
    out.pressure = p;
    out.density = p / (kGasConstant * T);
    out.speed_of_sound = std::sqrt(kGamma * kGasConstant * T);
    out.viscosity = aerodynamics::sutherland_viscosity(T);
    return out;
}

} // namespace std_atmosphere
