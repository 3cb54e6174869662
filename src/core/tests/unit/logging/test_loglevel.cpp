#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "logging/loglevel.h"

using namespace flat::core::logging;

namespace {

struct LevelNames {
    LogLevel level;
    const char* name;
    const char* lower;
    char letter;
};

const std::vector<LevelNames>& all_levels() {
    static const std::vector<LevelNames> levels = {
        {LogLevel::TRACE, "TRACE", "trace", 'T'},
        {LogLevel::DEBUG, "DEBUG", "debug", 'D'},
        {LogLevel::INFO,  "INFO",  "info",  'I'},
        {LogLevel::WARN,  "WARN",  "warn",  'W'},
        {LogLevel::ERROR, "ERROR", "error", 'E'},
        {LogLevel::FATAL, "FATAL", "fatal", 'F'},
        {LogLevel::OFF,   "OFF",   "off",   'O'},
    };
    return levels;
}

} // namespace

// ============================================================================
// Conversions
// ============================================================================

TEST(LogLevelTest, LevelsAreOrdered) {
    const auto& levels = all_levels();
    for (size_t i = 0; i < levels.size(); ++i) {
        EXPECT_EQ(static_cast<int>(levels[i].level), static_cast<int>(i));
    }
}

TEST(LogLevelTest, NamesOfEveryLevel) {
    for (const auto& entry : all_levels()) {
        EXPECT_EQ(to_string(entry.level), entry.name);
        EXPECT_EQ(to_short_string(entry.level), entry.letter);

        std::ostringstream oss;
        oss << entry.level;
        EXPECT_EQ(oss.str(), entry.name);
    }
}

TEST(LogLevelTest, OutOfRangeValue) {
    auto bogus = static_cast<LogLevel>(42);

    EXPECT_EQ(to_string(bogus), "UNKNOWN");
    EXPECT_EQ(to_short_string(bogus), '?');
}

TEST(LogLevelTest, ParsesUpperAndLowerCase) {
    for (const auto& entry : all_levels()) {
        EXPECT_EQ(from_string(entry.name), entry.level);
        EXPECT_EQ(from_string(entry.lower), entry.level);
    }
}

TEST(LogLevelTest, RejectsUnknownNames) {
    for (const char* text : {"", "Warn", "warning", " INFO", "3"}) {
        EXPECT_THROW(from_string(text), std::invalid_argument) << '"' << text << '"';
    }
}

TEST(LogLevelTest, ParseErrorNamesInput) {
    try {
        from_string("loud");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Invalid log level: loud");
    }
}

// ============================================================================
// Thresholds
// ============================================================================

TEST(LogLevelTest, ThresholdComparison) {
    EXPECT_TRUE(is_enabled(LogLevel::WARN, LogLevel::WARN));
    EXPECT_TRUE(is_enabled(LogLevel::ERROR, LogLevel::WARN));
    EXPECT_FALSE(is_enabled(LogLevel::DEBUG, LogLevel::WARN));
}

TEST(LogLevelTest, OffSilencesEverythingBelowIt) {
    for (const auto& entry : all_levels()) {
        EXPECT_EQ(is_enabled(entry.level, LogLevel::OFF), entry.level == LogLevel::OFF);
        EXPECT_TRUE(is_enabled(entry.level, LogLevel::TRACE));
    }
}

TEST(LogLevelTest, ConstexprEvaluation) {
    static_assert(to_string(LogLevel::WARN) == "WARN");
    static_assert(to_short_string(LogLevel::ERROR) == 'E');
    static_assert(is_enabled(LogLevel::FATAL, LogLevel::WARN));
    SUCCEED();
}

// ============================================================================
// LogLevelConfig Tests
// ============================================================================

TEST(LogLevelConfigTest, LibraryDefaultsToWarn) {
    EXPECT_EQ(LogLevelConfig::DEFAULT_LEVEL, LogLevel::WARN);
    EXPECT_EQ(LogLevelConfig::DEFAULT_CONSOLE_LEVEL, LogLevel::WARN);
}
