#include "core/FeedManager.hpp"
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace podarchive {
namespace core {

FeedManager::FeedManager(const std::string& storageFile, Logger logger)
    : storageFile_(storageFile), logger_(std::move(logger)) {
    load();
}

bool FeedManager::addPodcast(const Subscription& subscription) {
    if (subscription.name.empty() || subscription.feedUrl.empty() || subscription.directory.empty()) {
        logger_->error("A podcast needs a name, a feed URL and a directory");
        return false;
    }

    // Check if podcast already exists
    for (const auto& sub : subscriptions_) {
        if (sub.feedUrl == subscription.feedUrl || sub.name == subscription.name) {
            logger_->warn("Podcast with this name or URL already exists");
            return false;
        }
    }

    Subscription newSub = subscription;
    if (newSub.id.empty()) {
        newSub.id = Subscription::generateId(newSub.feedUrl);
    }
    subscriptions_.push_back(newSub);

    if (!save()) {
        subscriptions_.pop_back();
        return false;
    }
    logger_->info("Added podcast: {}", newSub.name);
    return true;
}

bool FeedManager::removePodcast(const std::string& identifier) {
    int index = findSubscriptionIndex(identifier);
    if (index == -1) {
        logger_->warn("Podcast not found: {}", identifier);
        return false;
    }

    Subscription removed = subscriptions_[index];
    subscriptions_.erase(subscriptions_.begin() + index);

    if (!save()) {
        subscriptions_.insert(subscriptions_.begin() + index, removed);
        return false;
    }
    logger_->info("Removed podcast: {}", removed.name);
    return true;
}

std::vector<Subscription> FeedManager::getSubscriptions() const {
    return subscriptions_;
}

std::optional<Subscription> FeedManager::findPodcast(const std::string& identifier) const {
    int index = findSubscriptionIndex(identifier);
    if (index == -1) {
        return std::nullopt;
    }
    return subscriptions_[index];
}

IngestionSummary FeedManager::ingest(IngestionContext& context, const Subscription& subscription) {
    PipelineOptions options = context.options;
    options.saveText = subscription.saveText;
    options.maxEpisodes = subscription.numEpisodes;

    logger_->info("Fetching feed: {}", subscription.name.empty() ? subscription.feedUrl : subscription.name);
    std::string bytes;
    try {
        bytes = fetchFeed(context.http, subscription.feedUrl, logger_);
    } catch (const FeedFetchError& e) {
        logger_->error("Error fetching the RSS feed: {}", e.what());
        logger_->error("Please check the URL and authentication token (if applicable)");
        throw;
    }

    IngestionPipeline pipeline(context.ledger, context.parser, context.transfer, context.tagWriter,
                               logger_, options, context.sleeper);
    return pipeline.run(subscription.feedUrl, bytes, subscription.directory);
}

SyncStatus FeedManager::syncAll(IngestionContext& context) {
    SyncStatus status = SyncStatus::Ok;
    if (subscriptions_.empty()) {
        logger_->info("No podcasts subscribed.");
        return status;
    }

    for (const auto& sub : subscriptions_) {
        try {
            ingest(context, sub);
        } catch (const FeedFetchError&) {
            // Already logged by ingest()
            if (status == SyncStatus::Ok) {
                status = SyncStatus::FeedFetchFailed;
            }
        } catch (const FeedParseError& e) {
            logger_->error("Error parsing feed for {}: {}", sub.name, e.what());
            if (status == SyncStatus::Ok) {
                status = SyncStatus::FeedParseFailed;
            }
        } catch (const TargetDirectoryError& e) {
            logger_->error("Skipping {}: {}", sub.name, e.what());
            if (status == SyncStatus::Ok) {
                status = SyncStatus::TargetDirectoryFailed;
            }
        }
    }
    return status;
}

bool FeedManager::save() {
    try {
        nlohmann::json j;
        j["subscriptions"] = nlohmann::json::array();

        for (const auto& sub : subscriptions_) {
            j["subscriptions"].push_back(sub.toJson());
        }

        std::ofstream file(storageFile_);
        if (!file.is_open()) {
            logger_->error("Could not open file for writing: {}", storageFile_);
            return false;
        }
        file << j.dump(4);
        file.close();
        if (!file) {
            logger_->error("Failed writing subscriptions to {}", storageFile_);
            return false;
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        logger_->error("Error saving subscriptions: {}", e.what());
        return false;
    }
}

void FeedManager::load() {
    subscriptions_.clear();

    std::ifstream file(storageFile_);
    if (!file.is_open()) {
        // File doesn't exist yet, start with empty subscriptions
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        logger_->error("Error loading subscriptions from {}: {}", storageFile_, e.what());
        return;
    }

    if (j.contains("subscriptions") && j["subscriptions"].is_array()) {
        for (const auto& subJson : j["subscriptions"]) {
            try {
                subscriptions_.push_back(Subscription::fromJson(subJson));
            } catch (const nlohmann::json::exception& e) {
                logger_->error("Error loading subscription: {}", e.what());
            }
        }
    }
}

int FeedManager::findSubscriptionIndex(const std::string& identifier) const {
    for (size_t i = 0; i < subscriptions_.size(); ++i) {
        if (subscriptions_[i].name == identifier ||
            subscriptions_[i].feedUrl == identifier ||
            subscriptions_[i].id == identifier) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace core
} // namespace podarchive
