#include "core/LedgerStore.hpp"
#include "core/TestSupport.hpp"
#include <gtest/gtest.h>
#include <sqlite3.h>

using namespace podarchive::core;
using podarchive::test::CapturedLog;
using podarchive::test::TempDir;

namespace {

EpisodeRecord makeRecord(FeedId feedId, const std::string& guid) {
    EpisodeRecord record;
    record.feedId = feedId;
    record.guid = guid;
    record.title = "Episode " + guid;
    record.publishedIso = "2024-01-15T10:00:00";
    record.filePath = "/archive/" + guid + ".mp3";
    record.ingestedAtIso = "2024-01-16T08:00:00.000000";
    return record;
}

void runSql(const std::string& dbPath, const std::string& sql) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(dbPath.c_str(), &db), SQLITE_OK);
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    std::string message = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK) << message;
}

int countRows(const std::string& dbPath, const std::string& table) {
    sqlite3* db = nullptr;
    sqlite3_open(dbPath.c_str(), &db);
    sqlite3_stmt* stmt = nullptr;
    std::string sql = "SELECT COUNT(*) FROM \"" + table + "\";";
    int count = -1;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK &&
        sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return count;
}

} // namespace

class LedgerStoreTest : public ::testing::Test {
protected:
    std::string dbPath() const { return (dir / "downloads.db").string(); }

    TempDir dir;
    Logger logger = makeNullLogger();
};

TEST_F(LedgerStoreTest, ResolveFeedIsIdempotentAcrossRuns) {
    FeedId first;
    {
        LedgerStore ledger(dbPath(), logger);
        first = ledger.resolveFeed("https://example.com/feed.xml?token=abc", "Show");
        EXPECT_EQ(ledger.resolveFeed("https://example.com/feed.xml?token=abc", "Show"), first);
        EXPECT_NE(ledger.resolveFeed("https://example.com/other.xml", "Other"), first);
    }

    LedgerStore reopened(dbPath(), logger);
    EXPECT_EQ(reopened.resolveFeed("https://example.com/feed.xml?token=abc", "Show"), first);
    EXPECT_EQ(reopened.listFeeds().size(), 2u);
}

TEST_F(LedgerStoreTest, UnknownFeedTitleIsFilledInLazily) {
    LedgerStore ledger(dbPath(), logger);
    const std::string url = "https://example.com/feed.xml";

    ledger.resolveFeed(url, "N/A");
    EXPECT_EQ(ledger.findFeed(url)->title, "N/A");

    ledger.resolveFeed(url, "Real Title");
    EXPECT_EQ(ledger.findFeed(url)->title, "Real Title");

    ledger.resolveFeed(url, "Renamed Later");
    EXPECT_EQ(ledger.findFeed(url)->title, "Real Title");
}

TEST_F(LedgerStoreTest, HasEpisodeReflectsRecordedEpisodes) {
    LedgerStore ledger(dbPath(), logger);
    FeedId feed = ledger.resolveFeed("https://example.com/a.xml", "A");
    FeedId other = ledger.resolveFeed("https://example.com/b.xml", "B");

    EXPECT_FALSE(ledger.hasEpisode(feed, "guid-1"));
    EXPECT_EQ(ledger.recordEpisode(makeRecord(feed, "guid-1")), RecordOutcome::Recorded);
    EXPECT_TRUE(ledger.hasEpisode(feed, "guid-1"));
    EXPECT_FALSE(ledger.hasEpisode(other, "guid-1"));
}

TEST_F(LedgerStoreTest, RecordingSamePairTwiceReportsDuplicate) {
    CapturedLog log;
    LedgerStore ledger(dbPath(), log.logger);
    FeedId feed = ledger.resolveFeed("https://example.com/a.xml", "A");

    EXPECT_EQ(ledger.recordEpisode(makeRecord(feed, "guid-1")), RecordOutcome::Recorded);
    EXPECT_EQ(ledger.recordEpisode(makeRecord(feed, "guid-1")), RecordOutcome::Duplicate);
    EXPECT_EQ(ledger.countEpisodes(feed), 1);
    EXPECT_NE(log.text().find("already in database"), std::string::npos);
}

TEST_F(LedgerStoreTest, SameGuidInDifferentFeedsIsNotADuplicate) {
    LedgerStore ledger(dbPath(), logger);
    FeedId a = ledger.resolveFeed("https://example.com/a.xml", "A");
    FeedId b = ledger.resolveFeed("https://example.com/b.xml", "B");

    EXPECT_EQ(ledger.recordEpisode(makeRecord(a, "shared")), RecordOutcome::Recorded);
    EXPECT_EQ(ledger.recordEpisode(makeRecord(b, "shared")), RecordOutcome::Recorded);
}

TEST_F(LedgerStoreTest, RacingHandlesLeaveExactlyOneRow) {
    LedgerStore first(dbPath(), logger);
    LedgerStore second(dbPath(), logger);
    FeedId feed = first.resolveFeed("https://example.com/a.xml", "A");
    ASSERT_EQ(second.resolveFeed("https://example.com/a.xml", "A"), feed);

    EXPECT_FALSE(first.hasEpisode(feed, "guid-1"));
    EXPECT_FALSE(second.hasEpisode(feed, "guid-1"));
    EXPECT_EQ(first.recordEpisode(makeRecord(feed, "guid-1")), RecordOutcome::Recorded);
    EXPECT_EQ(second.recordEpisode(makeRecord(feed, "guid-1")), RecordOutcome::Duplicate);
    EXPECT_EQ(first.countEpisodes(feed), 1);
}

TEST_F(LedgerStoreTest, RecordForUnknownFeedFails) {
    LedgerStore ledger(dbPath(), logger);
    EXPECT_EQ(ledger.recordEpisode(makeRecord(999, "guid-1")), RecordOutcome::Failed);
}

TEST_F(LedgerStoreTest, ListEpisodesReturnsStoredFields) {
    LedgerStore ledger(dbPath(), logger);
    FeedId feed = ledger.resolveFeed("https://example.com/a.xml", "A");
    ledger.recordEpisode(makeRecord(feed, "guid-1"));
    ledger.recordEpisode(makeRecord(feed, "guid-2"));

    auto episodes = ledger.listEpisodes(feed);
    ASSERT_EQ(episodes.size(), 2u);
    EXPECT_EQ(episodes[0].guid, "guid-1");
    EXPECT_EQ(episodes[0].title, "Episode guid-1");
    EXPECT_EQ(episodes[0].publishedIso, "2024-01-15T10:00:00");
    EXPECT_EQ(episodes[0].filePath, "/archive/guid-1.mp3");
    EXPECT_EQ(episodes[0].ingestedAtIso, "2024-01-16T08:00:00.000000");
    EXPECT_EQ(episodes[1].guid, "guid-2");
}

TEST_F(LedgerStoreTest, LegacySchemaIsArchivedNotDropped) {
    runSql(dbPath(),
           "CREATE TABLE episodes (guid TEXT PRIMARY KEY, title TEXT, filepath TEXT);"
           "INSERT INTO episodes VALUES ('old-1', 'Old', '/old.mp3');");

    CapturedLog log;
    {
        LedgerStore ledger(dbPath(), log.logger);
        FeedId feed = ledger.resolveFeed("https://example.com/a.xml", "A");
        EXPECT_FALSE(ledger.hasEpisode(feed, "old-1"));
        EXPECT_EQ(ledger.recordEpisode(makeRecord(feed, "new-1")), RecordOutcome::Recorded);
    }

    EXPECT_NE(log.text().find("Old database schema detected"), std::string::npos);
    EXPECT_EQ(countRows(dbPath(), LedgerStore::kArchivedEpisodesTable), 1);
    EXPECT_EQ(countRows(dbPath(), "episodes"), 1);

    // A second open finds the current schema and leaves everything alone
    CapturedLog secondLog;
    LedgerStore reopened(dbPath(), secondLog.logger);
    EXPECT_EQ(secondLog.text().find("Old database schema detected"), std::string::npos);
    EXPECT_EQ(countRows(dbPath(), LedgerStore::kArchivedEpisodesTable), 1);
}

TEST_F(LedgerStoreTest, ArchiveNameIsNotReused) {
    runSql(dbPath(),
           "CREATE TABLE episodes_old_pre_multi_feed (guid TEXT);"
           "INSERT INTO episodes_old_pre_multi_feed VALUES ('first');"
           "CREATE TABLE episodes (guid TEXT);"
           "INSERT INTO episodes VALUES ('second');");

    LedgerStore ledger(dbPath(), logger);
    EXPECT_EQ(countRows(dbPath(), "episodes_old_pre_multi_feed"), 1);
    EXPECT_EQ(countRows(dbPath(), "episodes_old_pre_multi_feed_2"), 1);
    EXPECT_EQ(countRows(dbPath(), "episodes"), 0);
}

TEST_F(LedgerStoreTest, UnopenableStoreThrows) {
    podarchive::test::writeFile(dir / "not-a-directory", "x");
    const std::string badPath = (dir / "not-a-directory" / "downloads.db").string();
    EXPECT_THROW(LedgerStore{badPath, logger}, LedgerError);
}

TEST_F(LedgerStoreTest, CorruptStoreThrows) {
    podarchive::test::writeFile(dir / "downloads.db", std::string(4096, 'z'));
    EXPECT_THROW(LedgerStore{dbPath(), logger}, LedgerError);
}
