#include "physics/utils.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <stdexcept>

namespace std_atmosphere {
namespace logging {

std::shared_ptr<spdlog::logger> get_logger() {
    std::shared_ptr<spdlog::logger> log = spdlog::get(kLoggerName);
    if (log) {
        return log;
    }

    static std::mutex create_mutex;
    std::lock_guard<std::mutex> lock(create_mutex);
    log = spdlog::get(kLoggerName);
    if (!log) {
        try {
            log = spdlog::stderr_color_mt(kLoggerName);
        } catch (const spdlog::spdlog_ex&) {
            // Registered by the caller between the lookup and the creation
            log = spdlog::get(kLoggerName);
        }
    }
    return log;
}

void set_level(spdlog::level::level_enum level) {
    get_logger()->set_level(level);
}

spdlog::level::level_enum parse_level(const std::string& level) {
    // from_str maps unknown names to off
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("log level '" + level +
                                    "' is not valid; use [trace, debug, info, warn, error, critical, off]");
    }
    return parsed;
}

void set_level(const std::string& level) {
    set_level(parse_level(level));
}

} // namespace logging
} // namespace std_atmosphere
