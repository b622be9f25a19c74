#include <iostream>
#include <iomanip>
#include <stdexcept>
#include "../src/physics/aerodynamics/aerodynamics.hpp"
#include "../src/physics/atmosphere.hpp"
#include "../src/physics/inverse.hpp"
#include "../src/physics/utils.hpp"
#include "../src/utils/config.hpp"
#include "../src/utils/profile_table.hpp"

using namespace std_atmosphere;

int main(int argc, char** argv) {
    config::TableConfig table_config;
    SolverOptions solver_options;

    try {
        if (argc > 1) {
            table_config = config::loadTableConfig(argv[1]);
            solver_options = config::loadSolverOptions(argv[1]);
        }
        logging::set_level(table_config.log_level);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    const UnitSet& u = table_config.units;
    std::cout << "=== Standard Atmosphere Demo ===" << std::endl;

    // --- Profile table ---
    VecX altitudes = table::altitude_grid(table_config.altitude_start,
                                          table_config.altitude_stop,
                                          table_config.altitude_step);
    table::ProfileTable profile = table::sample_profile(altitudes, u);

    std::cout << "\n--- Profile ---" << std::endl;
    std::cout << std::setw(12) << ("alt [" + u.altitude + "]")
              << std::setw(12) << ("T [" + u.temperature + "]")
              << std::setw(14) << ("p [" + u.pressure + "]")
              << std::setw(16) << ("rho [" + u.density + "]")
              << std::setw(12) << ("a [" + u.velocity + "]")
              << std::setw(22) << ("mu [" + u.dynamic_viscosity + "]") << std::endl;
    for (Eigen::Index i = 0; i < profile.rows(); ++i) {
        std::cout << std::fixed << std::setprecision(1) << std::setw(12) << profile.altitude(i)
                  << std::setprecision(3) << std::setw(12) << profile.temperature(i)
                  << std::scientific << std::setprecision(5)
                  << std::setw(14) << profile.pressure(i)
                  << std::setw(16) << profile.density(i)
                  << std::fixed << std::setprecision(2) << std::setw(12) << profile.speed_of_sound(i)
                  << std::scientific << std::setprecision(5) << std::setw(22) << profile.dynamic_viscosity(i)
                  << std::endl;
    }

    // --- Flight condition at the middle of the sweep ---
    std::cout << std::defaultfloat << std::setprecision(8);
    const double mach = 0.8;
    const double alt = 0.5 * (table_config.altitude_start + table_config.altitude_stop);
    const double q = aerodynamics::compute_dynamic_pressure(alt, mach, u.altitude, u.pressure);
    const double eas = aerodynamics::compute_equivalent_airspeed(alt, mach, u.altitude, u.velocity);
    const double rho = compute_density(alt, kGasConstant, u.altitude, u.density);

    std::cout << "\n--- Flight condition (M = " << mach << ", alt = " << alt << " " << u.altitude << ") ---" << std::endl;
    std::cout << "Velocity [" << u.velocity << "]: " << compute_velocity(alt, mach, u.altitude, u.velocity) << std::endl;
    std::cout << "Dynamic pressure [" << u.pressure << "]: " << q << std::endl;
    std::cout << "Equivalent airspeed [" << u.velocity << "]: " << eas << std::endl;
    std::cout << "Unit Reynolds number [" << u.unit_reynolds << "]: "
              << aerodynamics::compute_unit_reynolds_number(alt, mach, u.altitude, u.unit_reynolds) << std::endl;

    // --- Inverse problems ---
    SolveResult info;
    std::cout << "\n--- Altitude recovered from ---" << std::endl;
    std::cout << "Density: " << altitude_for_density(rho, u.density, u.altitude, solver_options, &info)
              << " " << u.altitude << " (" << info.iterations << " iterations)" << std::endl;
    std::cout << "Q/Mach: " << altitude_for_q_mach(q, mach, u.pressure, u.altitude, solver_options, &info)
              << " " << u.altitude << " (" << info.iterations << " iterations)" << std::endl;
    std::cout << "EAS/Mach: " << altitude_for_eas_mach(eas, mach, u.velocity, u.altitude, solver_options, &info)
              << " " << u.altitude << " (" << info.iterations << " iterations)" << std::endl;

    std::cout << "\n=== Demo completed ===" << std::endl;
    return 0;
}
