#pragma once

#ifndef LOGGING_LOGGER_H
#define LOGGING_LOGGER_H

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <vector>

#include "loglevel.h"
#include "logmessage.h"
#include "logsink.h"

#include "../config/config.h"

namespace flat::core::logging {

/**
 * @brief Named, thread-safe logger fanning messages out to its sinks
 *
 * Messages below the logger level are dropped before formatting. Each sink
 * then applies its own level on top.
 */
class Logger {
public:
    explicit Logger(std::string name,
                    LogLevel level = LogLevelConfig::DEFAULT_LEVEL)
        : logger_name_(std::move(name))
        , level_(level)
        , enabled_(true) {}

    ~Logger() {
        flush();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::INFO, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::WARN, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::ERROR, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(std::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::FATAL, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Log an already rendered message
     */
    void log(LogLevel level, std::string message,
             const std::source_location& loc = std::source_location::current()) {
        if (!should_log(level)) return;

        LogMessage msg(level, logger_name_, std::move(message), loc);
        msg.set_sequence_number(next_sequence_number_.fetch_add(1, std::memory_order_relaxed));

        write_to_sinks(msg);
    }

    // Configuration
    void set_level(LogLevel level) {
        level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel get_level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void set_enabled(bool enabled) {
        enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_enabled() const {
        return enabled_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const std::string& name() const { return logger_name_; }

    // Sink management
    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    void remove_sink(const std::shared_ptr<LogSink>& sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.clear();
    }

    [[nodiscard]] size_t sink_count() const {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        return sinks_.size();
    }

    [[nodiscard]] std::vector<std::shared_ptr<LogSink>> get_sinks() const {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        return sinks_;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& sink : sinks_) {
            sink->flush();
        }
    }

    [[nodiscard]] bool should_log(LogLevel level) const {
        return is_enabled() && logging::is_enabled(level, get_level());
    }

private:
    template<typename... Args>
    void log_formatted(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level)) return;
        log(level, std::format(fmt, std::forward<Args>(args)...));
    }

    void write_to_sinks(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& sink : sinks_) {
            if (sink->should_log(message)) {
                sink->write(message);
            }
        }
    }

    std::string logger_name_;
    std::atomic<LogLevel> level_;
    std::atomic<bool> enabled_;
    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::atomic<std::uint64_t> next_sequence_number_{1};
};

/**
 * @brief Logger used by the library itself
 *
 * Named "flat", level WARN, one ConsoleSink writing to stderr. Applications
 * may retune the level or swap the sinks at any time.
 */
Logger& library_logger();

} // namespace flat::core::logging

#if FLAT_ENABLE_LOGGING

#define FLAT_LOG(logger, level, ...) \
    do { \
        auto& flat_log_target_ = (logger); \
        if (flat_log_target_.should_log(level)) { \
            flat_log_target_.log(level, std::format(__VA_ARGS__), \
                                 std::source_location::current()); \
        } \
    } while(0)

#else

#define FLAT_LOG(logger, level, ...) ((void)0)

#endif

#define FLAT_LOG_TRACE(logger, ...) FLAT_LOG(logger, flat::core::logging::LogLevel::TRACE, __VA_ARGS__)
#define FLAT_LOG_DEBUG(logger, ...) FLAT_LOG(logger, flat::core::logging::LogLevel::DEBUG, __VA_ARGS__)
#define FLAT_LOG_INFO(logger, ...)  FLAT_LOG(logger, flat::core::logging::LogLevel::INFO, __VA_ARGS__)
#define FLAT_LOG_WARN(logger, ...)  FLAT_LOG(logger, flat::core::logging::LogLevel::WARN, __VA_ARGS__)
#define FLAT_LOG_ERROR(logger, ...) FLAT_LOG(logger, flat::core::logging::LogLevel::ERROR, __VA_ARGS__)
#define FLAT_LOG_FATAL(logger, ...) FLAT_LOG(logger, flat::core::logging::LogLevel::FATAL, __VA_ARGS__)

#endif //LOGGING_LOGGER_H
