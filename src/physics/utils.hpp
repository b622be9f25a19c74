#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace std_atmosphere {

/**
 * @brief Logging utilities
 *
 * The library reports non-fatal diagnostics (Sutherland extrapolation, slow
 * or stalled altitude inversions) through a single named spdlog logger.
 * Register a logger under kLoggerName before the first call to route the
 * messages elsewhere; otherwise a stderr colour logger is created on demand.
 */
namespace logging {

    constexpr const char* kLoggerName = "std-atmosphere";

    /**
     * @brief Get the library logger, creating it on first use
     * @return Shared pointer to the logger registered under kLoggerName
     */
    std::shared_ptr<spdlog::logger> get_logger();

    /**
     * @brief Set the library log level
     * @param level spdlog level; spdlog::level::off silences the library
     */
    void set_level(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name (trace, debug, info, warn, error, critical, off)
     * @param level Level name
     * @return spdlog level
     * @throws std::invalid_argument if the name is not a spdlog level
     */
    spdlog::level::level_enum parse_level(const std::string& level);

    /**
     * @brief Set the library log level from a name
     * @param level Level name accepted by parse_level
     */
    void set_level(const std::string& level);
}

} // namespace std_atmosphere
