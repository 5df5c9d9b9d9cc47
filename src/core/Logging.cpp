#include "core/Logging.hpp"
#include <stdexcept>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace podarchive {
namespace core {

spdlog::level::level_enum parseLogLevel(const std::string& level) {
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "error") {
        return spdlog::level::err;
    }
    throw std::invalid_argument("Unknown log level: " + level);
}

Logger makeLogger(const std::string& name, const std::string& level) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
    }
    logger->set_pattern("%Y-%m-%d %H:%M:%S,%e - %l - %v");
    logger->set_level(parseLogLevel(level));
    return logger;
}

Logger makeNullLogger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    return std::make_shared<spdlog::logger>(name, sink);
}

} // namespace core
} // namespace podarchive
