#pragma once

#include "core/HttpClient.hpp"
#include "core/IngestionPipeline.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace podarchive {
namespace core {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    std::string database;
    std::string subscriptions;
    int maxAttempts = TransferEngine::kDefaultMaxAttempts;
    int interItemDelaySeconds = 1;
    long requestTimeoutMs = 30000;
    std::string userAgent = HttpClientOptions{}.userAgent;
    std::string audioType = "audio/mpeg";
    std::string logLevel = "info";

    // Defaults with the ledger and subscription list stored in `baseDir`.
    static Config defaults(const std::filesystem::path& baseDir);

    // Overlays the keys present in `j` onto `base`. Throws ConfigError on a
    // key of the wrong type or an out-of-range value.
    static Config fromJson(const nlohmann::json& j, Config base);

    // Reads a JSON config file over the defaults. Throws ConfigError.
    static Config load(const std::filesystem::path& file, const std::filesystem::path& baseDir);

    nlohmann::json toJson() const;

    HttpClientOptions httpOptions() const;
    PipelineOptions pipelineOptions() const;
};

} // namespace core
} // namespace podarchive
