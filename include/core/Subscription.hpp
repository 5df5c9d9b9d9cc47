#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace podarchive {
namespace core {

// A feed the operator archives on every `sync`, with its own target
// directory and download options.
struct Subscription {
    std::string id;
    std::string name;
    std::string feedUrl;
    std::string directory;
    bool saveText;
    std::optional<std::size_t> numEpisodes;

    Subscription() : saveText(false) {}

    Subscription(const std::string& name, const std::string& feedUrl, const std::string& directory)
        : name(name), feedUrl(feedUrl), directory(directory), saveText(false) {
        id = generateId(feedUrl);
    }

    // Generate a simple ID from the feed URL
    static std::string generateId(const std::string& feedUrl) {
        std::hash<std::string> hasher;
        return std::to_string(hasher(feedUrl));
    }

    nlohmann::json toJson() const {
        nlohmann::json j{
            {"id", id},
            {"name", name},
            {"feedUrl", feedUrl},
            {"directory", directory},
            {"saveText", saveText}
        };
        if (numEpisodes) {
            j["numEpisodes"] = *numEpisodes;
        }
        return j;
    }

    static Subscription fromJson(const nlohmann::json& j) {
        Subscription sub;
        sub.name = j.at("name").get<std::string>();
        sub.feedUrl = j.at("feedUrl").get<std::string>();
        sub.directory = j.at("directory").get<std::string>();
        sub.id = j.value("id", generateId(sub.feedUrl));
        sub.saveText = j.value("saveText", false);
        if (j.contains("numEpisodes") && !j["numEpisodes"].is_null()) {
            sub.numEpisodes = j["numEpisodes"].get<std::size_t>();
        }
        return sub;
    }

    bool operator==(const Subscription& other) const {
        return id == other.id;
    }
};

} // namespace core
} // namespace podarchive
