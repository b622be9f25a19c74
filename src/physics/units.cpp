#include "physics/units.hpp"

#include <cstddef>
#include <vector>

namespace std_atmosphere {
namespace units {

namespace {

// Multiplicative factors to and from the canonical unit of a dimension
struct UnitFactor {
    const char* token;
    double to_canonical;
    double from_canonical;
};

struct Dimension {
    const char* name;
    std::vector<UnitFactor> factors;
};

const Dimension kAltitude = {"altitude", {
    {"ft",  1.0,           1.0},
    {"m",   1.0 / 0.3048,  0.3048},
    {"kft", 1000.0,        1.0 / 1000.0},
}};

const Dimension kVelocity = {"velocity", {
    {"ft/s",  1.0,           1.0},
    {"m/s",   1.0 / 0.3048,  0.3048},
    {"in/s",  1.0 / 12.0,    12.0},
    {"knots", 1.68781,       1.0 / 1.68781},
}};

const Dimension kPressure = {"pressure", {
    {"psf", 1.0,              1.0},
    {"psi", 144.0,            1.0 / 144.0},
    {"Pa",  1.0 / 47.880172,  47.880172},
}};

const Dimension kDensity = {"density", {
    {"slug/ft^3",   1.0,                 1.0},
    {"slinch/in^3", 20736.0,             1.0 / 20736.0},   // 12^4
    {"kg/m^3",      1.0 / 515.378818,    515.378818},
}};

const Dimension kTemperature = {"temperature", {
    {"R", 1.0,        1.0},
    {"K", 9.0 / 5.0,  5.0 / 9.0},
}};

const Dimension kDynamicViscosity = {"dynamic viscosity", {
    {"(lbf*s)/ft^2", 1.0,             1.0},
    {"(N*s)/m^2",    1.0 / 47.88026,  47.88026},
    {"Pa*s",         1.0 / 47.88026,  47.88026},
}};

const Dimension kKinematicViscosity = {"kinematic viscosity", {
    {"ft^2/s", 1.0,                      1.0},
    {"m^2/s",  1.0 / (0.3048 * 0.3048),  0.3048 * 0.3048},
}};

const Dimension kUnitReynolds = {"unit Reynolds number", {
    {"1/ft", 1.0,     1.0},
    {"1/m",  0.3048,  1.0 / 0.3048},
}};

const std::vector<const Dimension*> kDimensions = {
    &kAltitude, &kVelocity, &kPressure, &kDensity, &kTemperature,
    &kDynamicViscosity, &kKinematicViscosity, &kUnitReynolds
};

std::string accepted_tokens(const Dimension& dim) {
    std::string out = "[";
    for (std::size_t i = 0; i < dim.factors.size(); ++i) {
        if (i > 0) out += ", ";
        out += dim.factors[i].token;
    }
    return out + "]";
}

const UnitFactor& lookup(const Dimension& dim, const std::string& unit) {
    for (const UnitFactor& f : dim.factors) {
        if (unit == f.token) return f;
    }
    throw InvalidUnitError(dim.name, unit, accepted_tokens(dim));
}

double convert(double value, const Dimension& dim, const std::string& unit_in,
               const std::string& unit_out) {
    // Both tokens are validated before the identity shortcut
    const UnitFactor& in = lookup(dim, unit_in);
    const UnitFactor& out = lookup(dim, unit_out);
    if (unit_in == unit_out) {
        return value;
    }
    double factor = in.to_canonical * out.from_canonical;
    return value * factor;
}

} // namespace

InvalidUnitError::InvalidUnitError(const std::string& dimension, const std::string& unit,
                                   const std::string& accepted)
    : std::invalid_argument(dimension + " unit '" + unit + "' is not valid; use " + accepted),
      dimension_(dimension), unit_(unit) {
}

double convert_altitude(double alt, const std::string& alt_units_in,
                        const std::string& alt_units_out) {
    return convert(alt, kAltitude, alt_units_in, alt_units_out);
}

double convert_velocity(double velocity, const std::string& velocity_units_in,
                        const std::string& velocity_units_out) {
    return convert(velocity, kVelocity, velocity_units_in, velocity_units_out);
}

double convert_pressure(double pressure, const std::string& pressure_units_in,
                        const std::string& pressure_units_out) {
    return convert(pressure, kPressure, pressure_units_in, pressure_units_out);
}

double convert_density(double density, const std::string& density_units_in,
                       const std::string& density_units_out) {
    return convert(density, kDensity, density_units_in, density_units_out);
}

double convert_temperature(double temperature, const std::string& temperature_units_in,
                           const std::string& temperature_units_out) {
    return convert(temperature, kTemperature, temperature_units_in, temperature_units_out);
}

double convert_dynamic_viscosity(double mu, const std::string& visc_units_in,
                                 const std::string& visc_units_out) {
    return convert(mu, kDynamicViscosity, visc_units_in, visc_units_out);
}

double convert_kinematic_viscosity(double nu, const std::string& visc_units_in,
                                   const std::string& visc_units_out) {
    return convert(nu, kKinematicViscosity, visc_units_in, visc_units_out);
}

double convert_unit_reynolds(double reynolds, const std::string& units_in,
                             const std::string& units_out) {
    return convert(reynolds, kUnitReynolds, units_in, units_out);
}

void require_unit(const std::string& dimension, const std::string& unit) {
    for (const Dimension* dim : kDimensions) {
        if (dimension == dim->name) {
            lookup(*dim, unit);
            return;
        }
    }
    throw std::invalid_argument("unknown dimension '" + dimension + "'");
}

} // namespace units

void UnitSet::validate() const {
    units::require_unit("altitude", altitude);
    units::require_unit("velocity", velocity);
    units::require_unit("pressure", pressure);
    units::require_unit("density", density);
    units::require_unit("temperature", temperature);
    units::require_unit("dynamic viscosity", dynamic_viscosity);
    units::require_unit("kinematic viscosity", kinematic_viscosity);
    units::require_unit("unit Reynolds number", unit_reynolds);
}

} // namespace std_atmosphere
