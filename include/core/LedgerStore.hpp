#pragma once

#include "core/Logging.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace podarchive {
namespace core {

// Opening, migrating or creating the ledger failed; the run cannot
// safely deduplicate and must stop.
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using FeedId = std::int64_t;

struct FeedRow {
    FeedId id = 0;
    std::string url;
    std::string title;
};

struct EpisodeRecord {
    FeedId feedId = 0;
    std::string guid;
    std::string title;
    std::string publishedIso;   // YYYY-MM-DDTHH:MM:SS, empty if unknown
    std::string filePath;
    std::string ingestedAtIso;
};

enum class RecordOutcome {
    Recorded,
    Duplicate,  // (feed, guid) already present: a repeat run or a racing process
    Failed
};

// Persistent record of known feeds and ingested episodes, backed by SQLite.
// At most one episode row exists per (feed, guid).
class LedgerStore {
public:
    static constexpr const char* kArchivedEpisodesTable = "episodes_old_pre_multi_feed";

    // Throws LedgerError if the database can't be opened or prepared.
    LedgerStore(const std::string& dbPath, Logger logger);
    ~LedgerStore();

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    // Returns the id for `url`, registering it with `titleHint` on first
    // sight. A stored title that is unknown is replaced by a real hint.
    FeedId resolveFeed(const std::string& url, const std::string& titleHint);

    bool hasEpisode(FeedId feedId, const std::string& guid) const;

    // Never throws; failures other than a duplicate key are logged and
    // reported as Failed.
    RecordOutcome recordEpisode(const EpisodeRecord& record);

    // Queries
    std::optional<FeedRow> findFeed(const std::string& url) const;
    std::vector<FeedRow> listFeeds() const;
    std::vector<EpisodeRecord> listEpisodes(FeedId feedId) const;
    int countEpisodes(FeedId feedId) const;

    const std::string& path() const { return dbPath_; }

private:
    void open();
    void initializeSchema();
    void archiveLegacyEpisodes();
    bool tableExists(const std::string& table) const;
    bool columnExists(const std::string& table, const std::string& column) const;
    void execute(const char* sql);

    std::string dbPath_;
    Logger logger_;
    sqlite3* db_;
};

} // namespace core
} // namespace podarchive
