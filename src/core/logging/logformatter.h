#pragma once

#ifndef LOGGING_LOGFORMATTER_H
#define LOGGING_LOGFORMATTER_H

#include <string>
#include <string_view>
#include <memory>
#include <iomanip>
#include <sstream>
#include <format>
#include <ctime>

#include "logmessage.h"

namespace flat::core::logging {

/**
 * @brief Abstract base class for log message formatting
 *
 * Formatters control how log messages are converted to strings for output.
 * Each sink owns its own formatter.
 */
class LogFormatter {
public:
    virtual ~LogFormatter() = default;

    /**
     * @brief Format a log message into a string
     */
    [[nodiscard]] virtual std::string format(const LogMessage& message) const = 0;

    /**
     * @brief Clone the formatter
     */
    [[nodiscard]] virtual std::unique_ptr<LogFormatter> clone() const = 0;
};

/**
 * @brief Basic formatter with customizable format
 *
 * Format: [TIMESTAMP] [LEVEL] [LOGGER] [FILE:LINE] MESSAGE
 */
class BasicLogFormatter : public LogFormatter {
public:
    struct Options {
        bool include_timestamp = true;
        bool include_level = true;
        bool include_logger_name = true;
        bool include_location = false;
        bool use_short_level = false;
        std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
    };

    BasicLogFormatter() = default;
    explicit BasicLogFormatter(Options options)
        : options_(std::move(options)) {}

    [[nodiscard]] std::string format(const LogMessage& message) const override {
        std::ostringstream oss;

        if (options_.include_timestamp) {
            oss << '[' << format_timestamp(message.get_timestamp()) << "] ";
        }

        if (options_.include_level) {
            oss << '[';
            if (options_.use_short_level) {
                oss << to_short_string(message.get_level());
            } else {
                oss << std::left << std::setw(5) << to_string(message.get_level());
            }
            oss << "] ";
        }

        if (options_.include_logger_name && !message.get_logger_name().empty()) {
            oss << '[' << message.get_logger_name() << "] ";
        }

        if (options_.include_location) {
            oss << '[' << extract_filename(message.get_file_name())
                << ':' << message.get_line() << "] ";
        }

        oss << message.get_message();
        return oss.str();
    }

    [[nodiscard]] std::unique_ptr<LogFormatter> clone() const override {
        return std::make_unique<BasicLogFormatter>(options_);
    }

private:
    Options options_;

    [[nodiscard]] std::string format_timestamp(const LogMessage::time_point& tp) const {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};

#ifdef _WIN32
        localtime_s(&tm, &time_t);
#else
        localtime_r(&time_t, &tm);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm, options_.timestamp_format.c_str());

        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) % 1000;
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

        return oss.str();
    }

    [[nodiscard]] static std::string extract_filename(const char* path) {
        if (!path) return "";
        std::string_view sv(path);
        auto pos = sv.find_last_of("/\\");
        return std::string(pos != std::string_view::npos ? sv.substr(pos + 1) : sv);
    }
};

/**
 * @brief Compact formatter for minimal output
 *
 * Format: L: MESSAGE
 */
class CompactLogFormatter : public LogFormatter {
public:
    [[nodiscard]] std::string format(const LogMessage& message) const override {
        return std::format("{}: {}",
                           to_short_string(message.get_level()),
                           message.get_message());
    }

    [[nodiscard]] std::unique_ptr<LogFormatter> clone() const override {
        return std::make_unique<CompactLogFormatter>();
    }
};

} // namespace flat::core::logging

#endif //LOGGING_LOGFORMATTER_H
