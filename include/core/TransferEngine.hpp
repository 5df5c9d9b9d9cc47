#pragma once

#include "core/HttpClient.hpp"
#include "core/Logging.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace podarchive {
namespace core {

using Sleeper = std::function<void(std::chrono::seconds)>;

// Blocks the calling thread; the default for every component that waits.
void sleepFor(std::chrono::seconds duration);

struct TransferResult {
    bool ok = false;
    int attempts = 0;
    std::string lastError;
};

// Downloads a single payload with bounded retries and exponential backoff.
// After failed attempt k (1-based) it waits 2^k seconds, except after the
// last attempt. The body lands in `destination` through a ".part" file and
// a rename, so a failed transfer never leaves a truncated file behind.
class TransferEngine {
public:
    static constexpr int kDefaultMaxAttempts = 3;

    TransferEngine(FetchesBytes& http, Logger logger, Sleeper sleeper = sleepFor);

    TransferResult fetch(const std::string& url,
                         const std::filesystem::path& destination,
                         int maxAttempts = kDefaultMaxAttempts);

private:
    bool writeAtomically(const std::filesystem::path& destination, const std::string& body, std::string& error);

    FetchesBytes& http_;
    Logger logger_;
    Sleeper sleeper_;
};

} // namespace core
} // namespace podarchive
