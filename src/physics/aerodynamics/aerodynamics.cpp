#include "physics/aerodynamics/aerodynamics.hpp"
#include "physics/atmosphere.hpp"
#include "physics/environment/standard_atmosphere.hpp"
#include "physics/types.hpp"
#include "physics/units.hpp"
#include "physics/utils.hpp"
#include <cmath>

namespace std_atmosphere {
namespace aerodynamics {

using environment::StandardAtmosphere;

double sutherland_viscosity(double T) {
    if (T < kSutherlandLinearLimit) {
        return 8.0382436e-10 * T;
    }
    if (T > kSutherlandValidLimit) {
        logging::get_logger()->warn(
            "viscosity - temperature is too large for Sutherland's law (T > {} R); T = {} R",
            kSutherlandValidLimit, T);
    }
    return 2.27e-8 * std::pow(T, 1.5) / (T + 198.6);
}

double compute_dynamic_pressure(double alt, double mach, const std::string& alt_units,
                                const std::string& pressure_units) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double p = StandardAtmosphere::pressure(z);

    // gamma / 2 = 0.7
    double q = 0.7 * p * mach * mach;
    return units::convert_pressure(q, "psf", pressure_units);
}

double compute_equivalent_airspeed(double alt, double mach, const std::string& alt_units,
                                   const std::string& eas_units) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double a = compute_speed_of_sound(z);

    double T0 = StandardAtmosphere::temperature(kSeaLevelAltitude);
    double p0 = StandardAtmosphere::pressure(kSeaLevelAltitude);
    double T = StandardAtmosphere::temperature(z);
    double p = StandardAtmosphere::pressure(z);

    double eas = a * mach * std::sqrt((p * T0) / (T * p0));
    return units::convert_velocity(eas, "ft/s", eas_units);
}

double compute_dynamic_viscosity(double alt, const std::string& alt_units,
                                 const std::string& visc_units) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double mu = sutherland_viscosity(StandardAtmosphere::temperature(z));
    return units::convert_dynamic_viscosity(mu, "(lbf*s)/ft^2", visc_units);
}

double compute_kinematic_viscosity(double alt, const std::string& alt_units,
                                   const std::string& visc_units) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double rho = compute_density(z);
    double mu = compute_dynamic_viscosity(z);
    double nu = mu / rho;
    logging::get_logger()->debug("kinematic viscosity - rho={} [slug/ft^3] mu={} [lb*s/ft^2] nu={} [ft^2/s]",
                                 rho, mu, nu);
    return units::convert_kinematic_viscosity(nu, "ft^2/s", visc_units);
}

double compute_unit_reynolds_number(double alt, double mach, const std::string& alt_units,
                                    const std::string& reynolds_units) {
    double z = units::convert_altitude(alt, alt_units, "ft");
    double p = StandardAtmosphere::pressure(z);
    double T = StandardAtmosphere::temperature(z);

    // p = rho R T
    double a = std::sqrt(kGamma * kGasConstant * T);
    double mu = sutherland_viscosity(T);
    double ReL = p * a * mach / (mu * kGasConstant * T);

    auto log = logging::get_logger();
    if (log->should_log(spdlog::level::debug)) {
        log->debug("unit Reynolds number - z={} [ft] a={} [ft/s] rho={} [slug/ft^3] M={}",
                   z, a, p / (kGasConstant * T), mach);
        log->debug("unit Reynolds number - T={} [R] mu={} [(lbf*s)/ft^2] Re={} [1/ft]", T, mu, ReL);
    }
    return units::convert_unit_reynolds(ReL, "1/ft", reynolds_units);
}

double compute_unit_reynolds_number_from_properties(double alt, double mach, bool SI) {
    const UnitSet set = UnitSet::fromFlag(SI);
    double z = units::convert_altitude(alt, set.altitude, "ft");
    double rho = compute_density(z);
    double V = compute_velocity(z, mach);
    double mu = compute_dynamic_viscosity(z);

    double ReL = (rho * V) / mu;
    logging::get_logger()->debug("unit Reynolds number - z={} [ft] rho={} [slug/ft^3] V={} [ft/s] mu={} Re={} [1/ft]",
                                 z, rho, V, mu, ReL);
    return units::convert_unit_reynolds(ReL, "1/ft", set.unit_reynolds);
}

} // namespace aerodynamics
} // namespace std_atmosphere
