#include "profile_table.hpp"
#include "../physics/aerodynamics/aerodynamics.hpp"
#include "../physics/atmosphere.hpp"
#include <cmath>
#include <stdexcept>

namespace std_atmosphere {
namespace table {

MatX ProfileTable::asMatrix() const {
    MatX out(rows(), 7);
    out.col(0) = altitude;
    out.col(1) = temperature;
    out.col(2) = pressure;
    out.col(3) = density;
    out.col(4) = speed_of_sound;
    out.col(5) = dynamic_viscosity;
    out.col(6) = kinematic_viscosity;
    return out;
}

VecX altitude_grid(double start, double stop, double step) {
    if (!(step > 0.0)) {
        throw std::invalid_argument("altitude grid step must be positive");
    }
    if (stop < start) {
        return VecX(0);
    }
    // Small slack so a stop value on the grid survives rounding
    const Eigen::Index n = static_cast<Eigen::Index>(std::floor((stop - start) / step + 1e-9)) + 1;
    return VecX::LinSpaced(n, start, start + step * static_cast<double>(n - 1));
}

ProfileTable sample_profile(const VecX& altitudes, const UnitSet& unit_set) {
    unit_set.validate();

    ProfileTable out;
    const Eigen::Index n = altitudes.size();
    out.altitude = altitudes;
    out.temperature.resize(n);
    out.pressure.resize(n);
    out.density.resize(n);
    out.speed_of_sound.resize(n);
    out.dynamic_viscosity.resize(n);
    out.kinematic_viscosity.resize(n);
    out.units = unit_set;

    for (Eigen::Index i = 0; i < n; ++i) {
        const double z = units::convert_altitude(altitudes(i), unit_set.altitude, "ft");
        const AtmosphereState s = compute_state(z);

        out.temperature(i) = units::convert_temperature(s.temperature, "R", unit_set.temperature);
        out.pressure(i) = units::convert_pressure(s.pressure, "psf", unit_set.pressure);
        out.density(i) = units::convert_density(s.density, "slug/ft^3", unit_set.density);
        out.speed_of_sound(i) = units::convert_velocity(s.speed_of_sound, "ft/s", unit_set.velocity);
        out.dynamic_viscosity(i) = units::convert_dynamic_viscosity(s.viscosity, "(lbf*s)/ft^2",
                                                                    unit_set.dynamic_viscosity);
        out.kinematic_viscosity(i) = units::convert_kinematic_viscosity(
            s.viscosity / s.density, "ft^2/s", unit_set.kinematic_viscosity);
    }
    return out;
}

bool is_strictly_decreasing(const VecX& values) {
    for (Eigen::Index i = 1; i < values.size(); ++i) {
        if (!(values(i) < values(i - 1))) {
            return false;
        }
    }
    return true;
}

} // namespace table
} // namespace std_atmosphere
