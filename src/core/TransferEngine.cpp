#include "core/TransferEngine.hpp"
#include <fstream>
#include <system_error>
#include <thread>
#include <utility>

namespace podarchive {
namespace core {

void sleepFor(std::chrono::seconds duration) {
    std::this_thread::sleep_for(duration);
}

TransferEngine::TransferEngine(FetchesBytes& http, Logger logger, Sleeper sleeper)
    : http_(http), logger_(std::move(logger)), sleeper_(std::move(sleeper)) {
}

TransferResult TransferEngine::fetch(const std::string& url,
                                     const std::filesystem::path& destination,
                                     int maxAttempts) {
    TransferResult result;
    if (maxAttempts < 1) {
        maxAttempts = 1;
    }

    while (result.attempts < maxAttempts) {
        HttpResponse response = http_.get(url);
        ++result.attempts;

        if (response.ok()) {
            if (!writeAtomically(destination, response.body, result.lastError)) {
                // Local write failures are not retried
                logger_->error("Could not write {}: {}", destination.string(), result.lastError);
                return result;
            }
            if (result.attempts > 1) {
                logger_->info("Download succeeded after {} retry(ies): {}", result.attempts - 1, destination.string());
            } else {
                logger_->info("Downloaded: {}", destination.string());
            }
            result.ok = true;
            result.lastError.clear();
            return result;
        }

        result.lastError = response.describe();
        logger_->warn("Error downloading file (attempt {}/{}): {}", result.attempts, maxAttempts, result.lastError);
        if (result.attempts < maxAttempts) {
            const std::chrono::seconds backoff(1LL << result.attempts);
            logger_->info("Retrying in {} seconds...", backoff.count());
            sleeper_(backoff);
        }
    }

    logger_->error("Failed to download {} after {} attempts.", url, maxAttempts);
    return result;
}

bool TransferEngine::writeAtomically(const std::filesystem::path& destination,
                                     const std::string& body,
                                     std::string& error) {
    std::filesystem::path partial = destination;
    partial += ".part";

    {
        std::ofstream file(partial, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            error = "could not open " + partial.string() + " for writing";
            return false;
        }
        file.write(body.data(), static_cast<std::streamsize>(body.size()));
        file.close();
        if (!file) {
            error = "short write to " + partial.string();
            std::error_code ignored;
            std::filesystem::remove(partial, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(partial, destination, ec);
    if (ec) {
        error = ec.message();
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        return false;
    }
    return true;
}

} // namespace core
} // namespace podarchive
