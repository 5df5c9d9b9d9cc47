#pragma once

#include "core/HttpClient.hpp"
#include "core/IngestionPipeline.hpp"
#include "core/LedgerStore.hpp"
#include "core/Logging.hpp"
#include "core/PodcastFeed.hpp"
#include "core/Subscription.hpp"
#include "core/TagWriter.hpp"
#include "core/TransferEngine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace podarchive {
namespace core {

// Collaborators shared by every feed ingested in one run.
struct IngestionContext {
    LedgerStore& ledger;
    FetchesBytes& http;
    ParsesFeed& parser;
    TransferEngine& transfer;
    WritesTags& tagWriter;
    PipelineOptions options;
    Sleeper sleeper = sleepFor;
};

enum class SyncStatus {
    Ok,
    FeedFetchFailed,
    FeedParseFailed,
    TargetDirectoryFailed
};

class FeedManager {
public:
    FeedManager(const std::string& storageFile, Logger logger);

    // Subscription management
    bool addPodcast(const Subscription& subscription);
    bool removePodcast(const std::string& identifier); // Can be name, feed URL or id
    std::vector<Subscription> getSubscriptions() const;
    std::optional<Subscription> findPodcast(const std::string& identifier) const;

    // Ingestion. `ingest` fetches one feed and runs the pipeline over it,
    // throwing FeedFetchError, FeedParseError, TargetDirectoryError or
    // LedgerError. `syncAll` ingests every subscription, moving past feeds
    // that fail to fetch, parse or get a directory, and returns the first
    // such failure.
    IngestionSummary ingest(IngestionContext& context, const Subscription& subscription);
    SyncStatus syncAll(IngestionContext& context);

    // Persistence
    bool save();
    void load();

    int getSubscriptionCount() const { return static_cast<int>(subscriptions_.size()); }

private:
    int findSubscriptionIndex(const std::string& identifier) const;

    std::vector<Subscription> subscriptions_;
    std::string storageFile_;
    Logger logger_;
};

} // namespace core
} // namespace podarchive
