#pragma once

#ifndef LOGGING_LOGSINK_H
#define LOGGING_LOGSINK_H

#include <atomic>
#include <memory>
#include <iostream>
#include <mutex>
#include <vector>
#include <sstream>

#include "logmessage.h"
#include "logformatter.h"

namespace flat::core::logging {

/**
 * @brief Abstract base class for log output destinations
 *
 * A sink owns a formatter and its own minimum level, independent of the
 * level of the logger that feeds it.
 */
class LogSink {
public:
    LogSink() = default;
    virtual ~LogSink() = default;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    /**
     * @brief Write a log message to the sink
     */
    virtual void write(const LogMessage& message) = 0;

    /**
     * @brief Flush any buffered data
     */
    virtual void flush() = 0;

    void set_formatter(std::unique_ptr<LogFormatter> formatter) {
        std::lock_guard<std::mutex> lock(formatter_mutex_);
        formatter_ = std::move(formatter);
    }

    /**
     * @brief Format with the configured formatter (basic one if none set)
     */
    [[nodiscard]] std::string format(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(formatter_mutex_);
        if (!formatter_) {
            formatter_ = std::make_unique<BasicLogFormatter>();
        }
        return formatter_->format(message);
    }

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel get_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    void set_enabled(bool enabled) {
        enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_enabled() const {
        return enabled_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool should_log(const LogMessage& message) const {
        return is_enabled() && logging::is_enabled(message.get_level(), get_level());
    }

protected:
    std::unique_ptr<LogFormatter> formatter_;
    mutable std::mutex formatter_mutex_;

    std::atomic<LogLevel> min_level_{LogLevel::TRACE};
    std::atomic<bool> enabled_{true};
};

/**
 * @brief Console sink for stdout/stderr output
 */
class ConsoleSink : public LogSink {
public:
    enum class OutputMode {
        STDOUT_ONLY,
        STDERR_ONLY,
        SPLIT_BY_LEVEL
    };

    explicit ConsoleSink(OutputMode mode = OutputMode::SPLIT_BY_LEVEL)
        : mode_(mode) {}

    void write(const LogMessage& message) override {
        if (!should_log(message)) return;

        std::string formatted = format(message);

        std::ostream* out = &std::cout;
        switch (mode_) {
            case OutputMode::STDOUT_ONLY:
                out = &std::cout;
                break;
            case OutputMode::STDERR_ONLY:
                out = &std::cerr;
                break;
            case OutputMode::SPLIT_BY_LEVEL:
                out = (message.get_level() >= LogLevel::WARN) ? &std::cerr : &std::cout;
                break;
        }

        std::lock_guard<std::mutex> lock(output_mutex_);
        *out << formatted << '\n';
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout.flush();
        std::cerr.flush();
    }

    [[nodiscard]] OutputMode get_mode() const { return mode_; }

private:
    OutputMode mode_;
    std::mutex output_mutex_;
};

/**
 * @brief Memory sink keeping the most recent messages
 *
 * Oldest messages are dropped once max_messages is reached.
 */
class MemorySink : public LogSink {
public:
    explicit MemorySink(size_t max_messages = 10000)
        : max_messages_(max_messages) {}

    void write(const LogMessage& message) override {
        if (!should_log(message)) return;

        std::string formatted = format(message);

        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if (max_messages_ == 0) return;
        if (messages_.size() >= max_messages_) {
            messages_.erase(messages_.begin());
        }

        messages_.push_back(message);
        formatted_buffer_ << formatted << '\n';
    }

    void flush() override {}

    [[nodiscard]] std::vector<LogMessage> get_messages() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return messages_;
    }

    [[nodiscard]] std::string get_formatted_content() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return formatted_buffer_.str();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        messages_.clear();
        formatted_buffer_.str("");
        formatted_buffer_.clear();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return messages_.size();
    }

private:
    size_t max_messages_;
    mutable std::mutex buffer_mutex_;
    std::vector<LogMessage> messages_;
    std::stringstream formatted_buffer_;
};

} // namespace flat::core::logging

#endif //LOGGING_LOGSINK_H
