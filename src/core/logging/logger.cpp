#include "logger.h"

namespace flat::core::logging {

namespace {

std::shared_ptr<LogSink> make_default_sink() {
    auto sink = std::make_shared<ConsoleSink>(ConsoleSink::OutputMode::STDERR_ONLY);
    sink->set_level(LogLevelConfig::DEFAULT_CONSOLE_LEVEL);
    return sink;
}

} // namespace

Logger& library_logger() {
    static Logger logger("flat", LogLevelConfig::DEFAULT_LEVEL);
    static const bool initialized = [] {
        logger.add_sink(make_default_sink());
        return true;
    }();
    FLAT_UNUSED(initialized);
    return logger;
}

} // namespace flat::core::logging
