#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace podarchive {
namespace core {

using Logger = std::shared_ptr<spdlog::logger>;

// Colour console logger used by the CLI. Level is one of
// "debug", "info", "warn" or "error".
Logger makeLogger(const std::string& name, const std::string& level = "info");

// Logger that discards everything, for tests and library callers that
// don't care about output.
Logger makeNullLogger(const std::string& name = "null");

spdlog::level::level_enum parseLogLevel(const std::string& level);

} // namespace core
} // namespace podarchive
