#include "inverse.hpp"
#include "atmosphere.hpp"
#include "core/root_finding.hpp"
#include "environment/standard_atmosphere.hpp"
#include "units.hpp"
#include <cmath>

namespace std_atmosphere {

using environment::StandardAtmosphere;

namespace {

double finish(const SolveResult& result, const std::string& alt_units, SolveResult* info) {
    if (info) {
        *info = result;
    }
    return units::convert_altitude(result.altitude, "ft", alt_units);
}

} // namespace

double altitude_for_density(double density, const std::string& density_units,
                            const std::string& alt_units, const SolverOptions& options,
                            SolveResult* info) {
    double rho = units::convert_density(density, density_units, "slug/ft^3");
    units::require_unit("altitude", alt_units);

    SolveResult result = core::secant_solve(
        [](double z) { return compute_density(z); }, rho, options, "density");
    return finish(result, alt_units, info);
}

double altitude_for_pressure(double pressure, const std::string& pressure_units,
                             const std::string& alt_units, const SolverOptions& options,
                             SolveResult* info) {
    double p = units::convert_pressure(pressure, pressure_units, "psf");
    units::require_unit("altitude", alt_units);

    SolveResult result = core::secant_solve(
        [](double z) { return StandardAtmosphere::pressure(z); }, p, options, "pressure");
    return finish(result, alt_units, info);
}

double altitude_for_q_mach(double q, double mach, bool SI) {
    const UnitSet set = UnitSet::fromFlag(SI);
    return altitude_for_q_mach(q, mach, set.pressure, set.altitude);
}

double altitude_for_q_mach(double q, double mach, const std::string& pressure_units,
                           const std::string& alt_units, const SolverOptions& options,
                           SolveResult* info) {
    // q = gamma / 2 p M^2
    double pressure = 2.0 * q / (kGamma * mach * mach);
    return altitude_for_pressure(pressure, pressure_units, alt_units, options, info);
}

double altitude_for_eas_mach(double equivalent_airspeed, double mach,
                             const std::string& velocity_units, const std::string& alt_units,
                             const SolverOptions& options, SolveResult* info) {
    double eas = units::convert_velocity(equivalent_airspeed, velocity_units, "ft/s");
    units::require_unit("altitude", alt_units);

    double T0 = StandardAtmosphere::temperature(kSeaLevelAltitude);
    double p0 = StandardAtmosphere::pressure(kSeaLevelAltitude);
    double k = std::sqrt(T0 / p0);

    // eas = a M sqrt((p T0) / (T p0)) = a M sqrt(p / T) k
    auto eas_at = [mach, k](double z) {
        double T = StandardAtmosphere::temperature(z);
        double p = StandardAtmosphere::pressure(z);
        double a = std::sqrt(kGamma * kGasConstant * T);
        return a * mach * std::sqrt(p / T) * k;
    };

    SolveResult result = core::secant_solve(eas_at, eas, options, "equivalent airspeed");
    return finish(result, alt_units, info);
}

} // namespace std_atmosphere
