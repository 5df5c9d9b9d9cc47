#include "core/LedgerStore.hpp"
#include <filesystem>
#include <utility>

namespace podarchive {
namespace core {

namespace {

const char* const kCreateFeeds = R"(
    CREATE TABLE IF NOT EXISTS feeds (
        feed_id INTEGER PRIMARY KEY AUTOINCREMENT,
        feed_url TEXT UNIQUE NOT NULL,
        feed_title TEXT
    )
)";

const char* const kCreateEpisodes = R"(
    CREATE TABLE IF NOT EXISTS episodes (
        episode_id INTEGER PRIMARY KEY AUTOINCREMENT,
        feed_id INTEGER NOT NULL,
        guid TEXT NOT NULL,
        title TEXT,
        published TEXT,
        filepath TEXT,
        downloaded_at TEXT,
        FOREIGN KEY (feed_id) REFERENCES feeds (feed_id),
        UNIQUE (feed_id, guid)
    )
)";

bool isUnknownTitle(const std::string& title) {
    return title.empty() || title == "N/A";
}

// Owns a prepared statement for the duration of one query.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr) {
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw LedgerError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bind(int index, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
    }

    int step() {
        return sqlite3_step(stmt_);
    }

    std::string text(int column) const {
        const auto* value = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
        return value ? std::string(value) : std::string();
    }

    std::int64_t int64(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

    std::string errorMessage() const {
        return sqlite3_errmsg(db_);
    }

private:
    void check(int rc) const {
        if (rc != SQLITE_OK) {
            throw LedgerError("Failed to bind parameter: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

} // namespace

LedgerStore::LedgerStore(const std::string& dbPath, Logger logger)
    : dbPath_(dbPath), logger_(std::move(logger)), db_(nullptr) {
    open();
    try {
        initializeSchema();
    } catch (const LedgerError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    logger_->info("Database setup complete at {}", dbPath_);
}

LedgerStore::~LedgerStore() {
    if (db_) {
        sqlite3_close(db_);
        logger_->info("Database connection closed.");
    }
}

void LedgerStore::open() {
    const std::filesystem::path parent = std::filesystem::path(dbPath_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw LedgerError("Failed to create database directory " + parent.string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open_v2(dbPath_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw LedgerError("Failed to open database " + dbPath_ + ": " + message);
    }

    // Wait out a concurrent run holding the write lock
    sqlite3_busy_timeout(db_, 5000);
}

void LedgerStore::execute(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throw LedgerError("SQL error: " + message);
    }
}

void LedgerStore::initializeSchema() {
    execute("PRAGMA foreign_keys = ON;");

    if (tableExists("episodes") && !columnExists("episodes", "feed_id")) {
        archiveLegacyEpisodes();
    }

    execute(kCreateFeeds);
    execute(kCreateEpisodes);
}

void LedgerStore::archiveLegacyEpisodes() {
    std::string archiveName = kArchivedEpisodesTable;
    for (int suffix = 2; tableExists(archiveName); ++suffix) {
        archiveName = std::string(kArchivedEpisodesTable) + "_" + std::to_string(suffix);
    }

    logger_->warn("Old database schema detected. Archiving old 'episodes' table as '{}' and creating new schema. "
                  "Download history will be reset.", archiveName);
    const std::string sql = "ALTER TABLE episodes RENAME TO \"" + archiveName + "\";";
    execute(sql.c_str());
}

bool LedgerStore::tableExists(const std::string& table) const {
    Statement stmt(db_, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    stmt.bind(1, table);
    return stmt.step() == SQLITE_ROW;
}

bool LedgerStore::columnExists(const std::string& table, const std::string& column) const {
    Statement stmt(db_, "PRAGMA table_info(\"" + table + "\");");
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        if (stmt.text(1) == column) {
            return true;
        }
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError("Failed to inspect table " + table + ": " + stmt.errorMessage());
    }
    return false;
}

FeedId LedgerStore::resolveFeed(const std::string& url, const std::string& titleHint) {
    {
        Statement insert(db_, "INSERT OR IGNORE INTO feeds (feed_url, feed_title) VALUES (?, ?);");
        insert.bind(1, url);
        insert.bind(2, titleHint);
        if (insert.step() != SQLITE_DONE) {
            throw LedgerError("Failed to register feed " + url + ": " + insert.errorMessage());
        }
        if (sqlite3_changes(db_) > 0) {
            logger_->info("Added new feed to database: {}", titleHint);
        }
    }

    auto feed = findFeed(url);
    if (!feed) {
        throw LedgerError("Feed vanished after registration: " + url);
    }

    if (isUnknownTitle(feed->title) && !isUnknownTitle(titleHint)) {
        Statement update(db_, "UPDATE feeds SET feed_title = ? WHERE feed_id = ?;");
        update.bind(1, titleHint);
        update.bind(2, feed->id);
        if (update.step() != SQLITE_DONE) {
            logger_->warn("Could not update title for feed {}: {}", url, update.errorMessage());
        } else {
            logger_->info("Updated feed title: {}", titleHint);
        }
    }
    return feed->id;
}

bool LedgerStore::hasEpisode(FeedId feedId, const std::string& guid) const {
    Statement stmt(db_, "SELECT 1 FROM episodes WHERE feed_id = ? AND guid = ?;");
    stmt.bind(1, feedId);
    stmt.bind(2, guid);
    int rc = stmt.step();
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw LedgerError("Failed to query episode " + guid + ": " + stmt.errorMessage());
    }
    return rc == SQLITE_ROW;
}

RecordOutcome LedgerStore::recordEpisode(const EpisodeRecord& record) {
    try {
        Statement stmt(db_,
            "INSERT INTO episodes (feed_id, guid, title, published, filepath, downloaded_at) "
            "VALUES (?, ?, ?, ?, ?, ?);");
        stmt.bind(1, record.feedId);
        stmt.bind(2, record.guid);
        stmt.bind(3, record.title);
        stmt.bind(4, record.publishedIso);
        stmt.bind(5, record.filePath);
        stmt.bind(6, record.ingestedAtIso);

        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return RecordOutcome::Recorded;
        }

        int extended = sqlite3_extended_errcode(db_);
        if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
            logger_->warn("Episode with GUID {} already in database for this feed. Skipping DB entry.", record.guid);
            return RecordOutcome::Duplicate;
        }

        logger_->error("Failed to record episode {}: {}", record.guid, stmt.errorMessage());
        return RecordOutcome::Failed;
    } catch (const LedgerError& e) {
        logger_->error("Failed to record episode {}: {}", record.guid, e.what());
        return RecordOutcome::Failed;
    }
}

std::optional<FeedRow> LedgerStore::findFeed(const std::string& url) const {
    Statement stmt(db_, "SELECT feed_id, feed_url, feed_title FROM feeds WHERE feed_url = ?;");
    stmt.bind(1, url);
    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw LedgerError("Failed to query feed " + url + ": " + stmt.errorMessage());
    }
    return FeedRow{stmt.int64(0), stmt.text(1), stmt.text(2)};
}

std::vector<FeedRow> LedgerStore::listFeeds() const {
    std::vector<FeedRow> feeds;
    Statement stmt(db_, "SELECT feed_id, feed_url, feed_title FROM feeds ORDER BY feed_id;");
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        feeds.push_back(FeedRow{stmt.int64(0), stmt.text(1), stmt.text(2)});
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError("Failed to list feeds: " + stmt.errorMessage());
    }
    return feeds;
}

std::vector<EpisodeRecord> LedgerStore::listEpisodes(FeedId feedId) const {
    std::vector<EpisodeRecord> episodes;
    Statement stmt(db_,
        "SELECT feed_id, guid, title, published, filepath, downloaded_at "
        "FROM episodes WHERE feed_id = ? ORDER BY episode_id;");
    stmt.bind(1, feedId);
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        EpisodeRecord record;
        record.feedId = stmt.int64(0);
        record.guid = stmt.text(1);
        record.title = stmt.text(2);
        record.publishedIso = stmt.text(3);
        record.filePath = stmt.text(4);
        record.ingestedAtIso = stmt.text(5);
        episodes.push_back(record);
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError("Failed to list episodes: " + stmt.errorMessage());
    }
    return episodes;
}

int LedgerStore::countEpisodes(FeedId feedId) const {
    Statement stmt(db_, "SELECT COUNT(*) FROM episodes WHERE feed_id = ?;");
    stmt.bind(1, feedId);
    if (stmt.step() != SQLITE_ROW) {
        throw LedgerError("Failed to count episodes: " + stmt.errorMessage());
    }
    return static_cast<int>(stmt.int64(0));
}

} // namespace core
} // namespace podarchive
