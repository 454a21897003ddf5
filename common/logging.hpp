#ifndef SNOWFLAKE_COMMON_LOGGING_HPP
#define SNOWFLAKE_COMMON_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace snowflake::logging {

constexpr const char* LOGGER_NAME = "snowflake";
constexpr const char* LEVEL_VARIABLE = "SNOWFLAKE_LOG_LEVEL";

// Level named by SNOWFLAKE_LOG_LEVEL (spdlog names plus "warn" and "err").
// Unset or unrecognised values give info.
inline spdlog::level::level_enum level_from_environment() {
    const char* value = std::getenv(LEVEL_VARIABLE);
    if (!value) {
        return spdlog::level::info;
    }
    std::string name(value);
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

// Shared stderr logger, created on first use
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto log = spdlog::stderr_color_mt(LOGGER_NAME);
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(level_from_environment());
        return log;
    }();
    return logger;
}

// Command line -v: lowers the level to debug, never raises it (trace stays)
inline void enable_verbose() {
    auto log = get_logger();
    if (log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace snowflake::logging

#endif // SNOWFLAKE_COMMON_LOGGING_HPP
