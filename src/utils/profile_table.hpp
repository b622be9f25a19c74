#pragma once

#include "../physics/types.hpp"
#include "../physics/units.hpp"
#include <Eigen/Dense>

namespace std_atmosphere {
namespace table {

/**
 * @brief Atmosphere properties sampled on an altitude grid
 *
 * All columns share the length of altitude and are expressed in the
 * UnitSet the table was sampled with.
 */
struct ProfileTable {
    VecX altitude;
    VecX temperature;
    VecX pressure;
    VecX density;
    VecX speed_of_sound;
    VecX dynamic_viscosity;
    VecX kinematic_viscosity;
    UnitSet units;

    Eigen::Index rows() const { return altitude.size(); }

    /**
     * @brief Columns as one matrix
     * @return rows() x 7 matrix ordered altitude, T, p, rho, a, mu, nu
     */
    MatX asMatrix() const;
};

/**
 * @brief Evenly spaced altitudes from start to stop
 * @param start First altitude
 * @param stop Last altitude; included when it falls on the grid
 * @param step Spacing (must be positive)
 * @return Altitude vector
 */
VecX altitude_grid(double start, double stop, double step);

/**
 * @brief Evaluate the standard atmosphere on an altitude grid
 * @param altitudes Altitudes in unit_set.altitude
 * @param unit_set Input altitude units and output units
 * @return Table of sampled properties
 */
ProfileTable sample_profile(const VecX& altitudes, const UnitSet& unit_set = UnitSet());

/**
 * @brief Check that every entry is below its predecessor
 * @param values Sampled values
 * @return True if strictly decreasing (vacuously true for fewer than 2 entries)
 */
bool is_strictly_decreasing(const VecX& values);

} // namespace table
} // namespace std_atmosphere
