#include "core/Config.hpp"
#include "core/Logging.hpp"
#include <fstream>

namespace podarchive {
namespace core {

namespace {

template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) {
        return;
    }
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

Config Config::defaults(const std::filesystem::path& baseDir) {
    Config config;
    config.database = (baseDir / "downloads.db").string();
    config.subscriptions = (baseDir / "podcasts.json").string();
    return config;
}

Config Config::fromJson(const nlohmann::json& j, Config base) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    readKey(j, "database", base.database);
    readKey(j, "subscriptions", base.subscriptions);
    readKey(j, "maxAttempts", base.maxAttempts);
    readKey(j, "interItemDelaySeconds", base.interItemDelaySeconds);
    readKey(j, "requestTimeoutMs", base.requestTimeoutMs);
    readKey(j, "userAgent", base.userAgent);
    readKey(j, "audioType", base.audioType);
    readKey(j, "logLevel", base.logLevel);

    if (base.maxAttempts < 1) {
        throw ConfigError("maxAttempts must be at least 1");
    }
    if (base.interItemDelaySeconds < 0) {
        throw ConfigError("interItemDelaySeconds must not be negative");
    }
    try {
        parseLogLevel(base.logLevel);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    return base;
}

Config Config::load(const std::filesystem::path& file, const std::filesystem::path& baseDir) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw ConfigError("Could not open config file: " + file.string());
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Could not parse config file " + file.string() + ": " + e.what());
    }
    return fromJson(j, defaults(baseDir));
}

nlohmann::json Config::toJson() const {
    return nlohmann::json{
        {"database", database},
        {"subscriptions", subscriptions},
        {"maxAttempts", maxAttempts},
        {"interItemDelaySeconds", interItemDelaySeconds},
        {"requestTimeoutMs", requestTimeoutMs},
        {"userAgent", userAgent},
        {"audioType", audioType},
        {"logLevel", logLevel}
    };
}

HttpClientOptions Config::httpOptions() const {
    HttpClientOptions options;
    options.userAgent = userAgent;
    options.timeoutMs = requestTimeoutMs;
    return options;
}

PipelineOptions Config::pipelineOptions() const {
    PipelineOptions options;
    options.maxAttempts = maxAttempts;
    options.interItemDelay = std::chrono::seconds(interItemDelaySeconds);
    options.audioType = audioType;
    return options;
}

} // namespace core
} // namespace podarchive
