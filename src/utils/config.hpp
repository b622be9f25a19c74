#pragma once

#include "../physics/types.hpp"
#include "../physics/units.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace std_atmosphere {
namespace config {

/**
 * @brief Altitude sweep for a printed profile table
 */
struct TableConfig {
    double altitude_start = 0.0;       // In units.altitude
    double altitude_stop = 100000.0;   // In units.altitude, inclusive when on the grid
    double altitude_step = 10000.0;    // In units.altitude
    UnitSet units;                     // Output units
    std::string log_level = "warn";

    TableConfig() = default;
};

/**
 * @brief Read solver settings from a YAML node
 * @param node Node holding any of previous_guess, initial_guess, step,
 *             tolerance, max_iterations, warn_iterations
 * @return Options with missing keys left at their defaults
 */
SolverOptions parseSolverOptions(const YAML::Node& node);

/**
 * @brief Read a table sweep from a YAML node
 * @param node Node holding start, stop, step, SI, units, log_level
 * @return Table configuration; unit tokens and log_level are validated
 */
TableConfig parseTableConfig(const YAML::Node& node);

/**
 * @brief Load solver settings from the "solver" section of a YAML file
 * @param filename Path to the configuration file
 * @return Solver options
 */
SolverOptions loadSolverOptions(const std::string& filename = "configs/atmosphere.yaml");

/**
 * @brief Load the "table" section of a YAML file
 * @param filename Path to the configuration file
 * @return Table configuration
 */
TableConfig loadTableConfig(const std::string& filename = "configs/atmosphere.yaml");

} // namespace config
} // namespace std_atmosphere
