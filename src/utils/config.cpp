#include "config.hpp"
#include "../physics/utils.hpp"
#include <stdexcept>

namespace std_atmosphere {
namespace config {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

YAML::Node loadSection(const std::string& filename, const char* section) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("failed to load " + filename + ": " + e.what());
    }
    const YAML::Node& croot = root;
    return croot[section];
}

} // namespace

SolverOptions parseSolverOptions(const YAML::Node& node) {
    SolverOptions options;
    if (!node) {
        return options;
    }
    try {
        read(node, "previous_guess", options.previous_guess);
        read(node, "initial_guess", options.initial_guess);
        read(node, "step", options.step);
        read(node, "tolerance", options.tolerance);
        read(node, "max_iterations", options.max_iterations);
        read(node, "warn_iterations", options.warn_iterations);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("invalid solver options: ") + e.what());
    }
    options.validate();
    return options;
}

TableConfig parseTableConfig(const YAML::Node& node) {
    TableConfig table;
    if (!node) {
        return table;
    }
    try {
        bool SI = false;
        read(node, "SI", SI);
        table.units = UnitSet::fromFlag(SI);

        read(node, "start", table.altitude_start);
        read(node, "stop", table.altitude_stop);
        read(node, "step", table.altitude_step);
        read(node, "log_level", table.log_level);

        // Per-dimension overrides
        const YAML::Node unit_node = node["units"];
        if (unit_node) {
            read(unit_node, "altitude", table.units.altitude);
            read(unit_node, "velocity", table.units.velocity);
            read(unit_node, "pressure", table.units.pressure);
            read(unit_node, "density", table.units.density);
            read(unit_node, "temperature", table.units.temperature);
            read(unit_node, "dynamic_viscosity", table.units.dynamic_viscosity);
            read(unit_node, "kinematic_viscosity", table.units.kinematic_viscosity);
            read(unit_node, "unit_reynolds", table.units.unit_reynolds);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("invalid table configuration: ") + e.what());
    }

    if (!(table.altitude_step > 0.0)) {
        throw std::invalid_argument("table step must be positive");
    }
    if (table.altitude_stop < table.altitude_start) {
        throw std::invalid_argument("table stop must not be below start");
    }
    table.units.validate();
    logging::parse_level(table.log_level);
    return table;
}

SolverOptions loadSolverOptions(const std::string& filename) {
    return parseSolverOptions(loadSection(filename, "solver"));
}

TableConfig loadTableConfig(const std::string& filename) {
    return parseTableConfig(loadSection(filename, "table"));
}

} // namespace config
} // namespace std_atmosphere
