#pragma once

#ifndef LOGGING_LOGLEVEL_H
#define LOGGING_LOGLEVEL_H

#include <string>
#include <string_view>
#include <ostream>
#include <stdexcept>

namespace flat::core::logging {

/**
 * @brief Logging severity levels
 *
 * Higher values indicate more severe conditions:
 * - TRACE: Detailed tracing of library internals
 * - DEBUG: Debugging information for development
 * - INFO: General informational messages
 * - WARN: Degraded results that still let the library continue
 * - ERROR: Error conditions that need handling
 * - FATAL: Critical errors
 * - OFF: Disable all logging
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

/**
 * @brief Convert LogLevel to string representation
 */
constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default:              return "UNKNOWN";
    }
}

/**
 * @brief Convert LogLevel to short string (single character)
 */
constexpr char to_short_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return 'T';
        case LogLevel::DEBUG: return 'D';
        case LogLevel::INFO:  return 'I';
        case LogLevel::WARN:  return 'W';
        case LogLevel::ERROR: return 'E';
        case LogLevel::FATAL: return 'F';
        case LogLevel::OFF:   return 'O';
        default:              return '?';
    }
}

/**
 * @brief Convert string to LogLevel
 */
inline LogLevel from_string(std::string_view str) {
    if (str == "TRACE" || str == "trace") return LogLevel::TRACE;
    if (str == "DEBUG" || str == "debug") return LogLevel::DEBUG;
    if (str == "INFO"  || str == "info")  return LogLevel::INFO;
    if (str == "WARN"  || str == "warn")  return LogLevel::WARN;
    if (str == "ERROR" || str == "error") return LogLevel::ERROR;
    if (str == "FATAL" || str == "fatal") return LogLevel::FATAL;
    if (str == "OFF"   || str == "off")   return LogLevel::OFF;

    throw std::invalid_argument("Invalid log level: " + std::string(str));
}

/**
 * @brief Check if a message level passes a threshold level
 */
constexpr bool is_enabled(LogLevel message_level, LogLevel threshold) noexcept {
    return static_cast<int>(message_level) >= static_cast<int>(threshold);
}

inline std::ostream& operator<<(std::ostream& os, LogLevel level) {
    return os << to_string(level);
}

/**
 * @brief Defaults for the library logger
 */
struct LogLevelConfig {
    static constexpr LogLevel DEFAULT_LEVEL = LogLevel::WARN;
    static constexpr LogLevel DEFAULT_CONSOLE_LEVEL = LogLevel::WARN;
};

} // namespace flat::core::logging

#endif //LOGGING_LOGLEVEL_H
