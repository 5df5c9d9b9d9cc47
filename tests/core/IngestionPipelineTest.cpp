#include "core/IngestionPipeline.hpp"
#include "core/TestSupport.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <sqlite3.h>

using namespace podarchive::core;
using namespace podarchive::test;
using std::chrono::seconds;

namespace {

const std::string kFeedUrl = "https://example.com/feed.xml?token=secret";

RssItem episode(int n) {
    RssItem item;
    item.title = "Episode " + std::to_string(n);
    item.guid = "guid-" + std::to_string(n);
    item.pubDate = "Mon, " + std::to_string(10 + n) + " Jun 2024 09:00:00 GMT";
    item.url = "https://cdn.example.com/ep" + std::to_string(n) + ".mp3";
    return item;
}

// Newest first, as feeds list them
std::vector<RssItem> episodes(int newest, int oldest) {
    std::vector<RssItem> items;
    for (int n = newest; n >= oldest; --n) {
        items.push_back(episode(n));
    }
    return items;
}

} // namespace

class IngestionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger = std::make_unique<LedgerStore>((dir / "downloads.db").string(), logger);
        transfer = std::make_unique<TransferEngine>(http, logger, sleeper.sleeper());
    }

    void serveAll(const std::vector<RssItem>& items) {
        for (const auto& item : items) {
            http.serve(item.url, okResponse("audio:" + item.url));
        }
    }

    IngestionSummary runFeed(const std::string& xml, PipelineOptions options = {}) {
        IngestionPipeline pipeline(*ledger, parser, *transfer, tagWriter, logger, options, sleeper.sleeper());
        return pipeline.run(kFeedUrl, xml, archive());
    }

    IngestionSummary runDocument(const FeedDocument& document, PipelineOptions options = {}) {
        StaticFeedParser staticParser(document);
        IngestionPipeline pipeline(*ledger, staticParser, *transfer, tagWriter, logger, options, sleeper.sleeper());
        return pipeline.run(kFeedUrl, "<ignored/>", archive());
    }

    std::filesystem::path archive() const { return dir / "archive"; }

    int archivedAudioFiles() const {
        int count = 0;
        if (!std::filesystem::exists(archive())) {
            return 0;
        }
        for (const auto& entry : std::filesystem::directory_iterator(archive())) {
            if (entry.path().extension() != ".txt") {
                ++count;
            }
        }
        return count;
    }

    std::set<std::string> recordedGuids(FeedId feed) const {
        std::set<std::string> guids;
        for (const auto& record : ledger->listEpisodes(feed)) {
            guids.insert(record.guid);
        }
        return guids;
    }

    TempDir dir;
    Logger logger = makeNullLogger();
    FakeHttp http;
    RecordingSleeper sleeper;
    FakeTagWriter tagWriter;
    PugiFeedParser parser;
    std::unique_ptr<LedgerStore> ledger;
    std::unique_ptr<TransferEngine> transfer;
};

TEST_F(IngestionPipelineTest, FirstRunDownloadsEverythingSecondRunNothing) {
    auto items = episodes(3, 1);
    serveAll(items);
    const std::string xml = rssFeed("Example Show", items);

    IngestionSummary first = runFeed(xml);
    EXPECT_EQ(first.totalCandidates, 3u);
    EXPECT_EQ(first.pending, 3u);
    EXPECT_EQ(first.succeeded, 3u);
    EXPECT_EQ(archivedAudioFiles(), 3);
    EXPECT_EQ(ledger->countEpisodes(first.feedId), 3);

    const auto requestsAfterFirstRun = http.requests.size();
    IngestionSummary second = runFeed(xml);
    EXPECT_EQ(second.feedId, first.feedId);
    EXPECT_EQ(second.pending, 0u);
    EXPECT_EQ(second.succeeded, 0u);
    EXPECT_EQ(http.requests.size(), requestsAfterFirstRun);
    EXPECT_EQ(archivedAudioFiles(), 3);
    EXPECT_EQ(ledger->countEpisodes(first.feedId), 3);
}

TEST_F(IngestionPipelineTest, FileNamesCarryDatePrefixAndUrlExtension) {
    RssItem item = episode(1);
    item.title = "Caf\xC3\xA9 Talk: Part 1";
    item.pubDate = "Tue, 02 Jul 2024 06:00:00 +0000";
    item.url = "https://cdn.example.com/audio/file%201.mp3?token=abc";
    serveAll({item});

    runFeed(rssFeed("Example Show", {item}));

    const auto expected = archive() / "2024-07-02_cafe_talk_part_1.mp3";
    EXPECT_TRUE(std::filesystem::exists(expected));
    EXPECT_EQ(readFile(expected), "audio:" + item.url);
}

TEST_F(IngestionPipelineTest, MissingUrlExtensionFallsBackToMp3) {
    RssItem item = episode(1);
    item.pubDate = "";
    item.url = "https://cdn.example.com/stream/12345";
    serveAll({item});

    runFeed(rssFeed("Example Show", {item}));

    EXPECT_TRUE(std::filesystem::exists(archive() / "episode_1.mp3"));
}

TEST_F(IngestionPipelineTest, NumEpisodesWindowAppliesBeforeDedup) {
    auto items = episodes(5, 1);
    serveAll(items);
    PipelineOptions options;
    options.maxEpisodes = 1;

    IngestionSummary first = runFeed(rssFeed("Example Show", items), options);
    EXPECT_EQ(first.totalCandidates, 5u);
    EXPECT_EQ(first.considered, 1u);
    EXPECT_EQ(first.succeeded, 1u);
    EXPECT_EQ(recordedGuids(first.feedId), (std::set<std::string>{"guid-5"}));

    // Same feed again: the only candidate considered is already archived
    IngestionSummary repeat = runFeed(rssFeed("Example Show", items), options);
    EXPECT_EQ(repeat.considered, 1u);
    EXPECT_EQ(repeat.pending, 0u);

    // A new episode at the top pushes the window forward; older ones are never reached
    auto grown = episodes(6, 1);
    serveAll(grown);
    IngestionSummary third = runFeed(rssFeed("Example Show", grown), options);
    EXPECT_EQ(third.succeeded, 1u);
    EXPECT_EQ(recordedGuids(first.feedId), (std::set<std::string>{"guid-5", "guid-6"}));
    EXPECT_EQ(http.requestCount(episode(4).url), 0);
}

TEST_F(IngestionPipelineTest, WindowLargerThanFeedConsidersEverything) {
    auto items = episodes(2, 1);
    serveAll(items);
    PipelineOptions options;
    options.maxEpisodes = 10;

    IngestionSummary summary = runFeed(rssFeed("Example Show", items), options);
    EXPECT_EQ(summary.considered, 2u);
    EXPECT_EQ(summary.succeeded, 2u);
}

TEST_F(IngestionPipelineTest, ExpandsEveryAudioEnclosure) {
    FeedDocument feed;
    FeedEntry entry;
    entry.title = "Two Parts";
    entry.links = {
        {"audio/mpeg", "https://cdn.example.com/part1.mp3"},
        {"video/mp4", "https://cdn.example.com/video.mp4"},
        {"audio/mpeg", "https://cdn.example.com/part2.mp3"},
    };
    FeedEntry noAudio;
    noAudio.title = "Text only";
    feed.entries = {entry, noAudio};

    auto candidates = expandCandidates(feed, "audio/mpeg");
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].link.href, "https://cdn.example.com/part1.mp3");
    EXPECT_EQ(candidates[1].link.href, "https://cdn.example.com/part2.mp3");
    // Without a feed GUID each enclosure is its own episode
    EXPECT_EQ(candidates[0].guid, "https://cdn.example.com/part1.mp3");
    EXPECT_EQ(candidates[1].guid, "https://cdn.example.com/part2.mp3");
    EXPECT_EQ(candidates[0].entry, &feed.entries[0]);
}

TEST_F(IngestionPipelineTest, GuidFallsBackToEnclosureUrl) {
    RssItem item = episode(1);
    item.guid = "";
    serveAll({item});

    IngestionSummary summary = runFeed(rssFeed("Example Show", {item}));

    EXPECT_EQ(recordedGuids(summary.feedId), (std::set<std::string>{item.url}));
    EXPECT_TRUE(ledger->hasEpisode(summary.feedId, item.url));

    // The fallback is applied on the dedup check as well
    IngestionSummary again = runFeed(rssFeed("Example Show", {item}));
    EXPECT_EQ(again.pending, 0u);
}

TEST_F(IngestionPipelineTest, ResolveGuidPrefersFeedIdentifier) {
    FeedEntry entry;
    EnclosureLink link{"audio/mpeg", "https://cdn.example.com/a.mp3"};
    EXPECT_EQ(resolveGuid(entry, link), link.href);
    entry.guid = "";
    EXPECT_EQ(resolveGuid(entry, link), link.href);
    entry.guid = "stable-id";
    EXPECT_EQ(resolveGuid(entry, link), "stable-id");
}

TEST_F(IngestionPipelineTest, DuplicateFromRacingRunIsBenign) {
    RssItem item = episode(1);
    serveAll({item});

    // Another process records the episode while this run is downloading it
    LedgerStore racer((dir / "downloads.db").string(), logger);
    http.onGet = [&](const std::string& url) {
        if (url != item.url) {
            return;
        }
        EpisodeRecord record;
        record.feedId = racer.resolveFeed(kFeedUrl, "Example Show");
        record.guid = item.guid;
        record.title = item.title;
        record.filePath = "elsewhere.mp3";
        record.ingestedAtIso = "2024-06-11T00:00:00.000000";
        EXPECT_EQ(racer.recordEpisode(record), RecordOutcome::Recorded);
    };

    IngestionSummary summary;
    ASSERT_NO_THROW(summary = runFeed(rssFeed("Example Show", {item})));

    EXPECT_EQ(summary.pending, 1u);
    EXPECT_EQ(summary.succeeded, 0u);
    EXPECT_EQ(summary.duplicates, 1u);
    EXPECT_EQ(ledger->countEpisodes(summary.feedId), 1);
    EXPECT_EQ(ledger->listEpisodes(summary.feedId)[0].filePath, "elsewhere.mp3");
    // The other run owns the episode; this one leaves the file untouched
    EXPECT_TRUE(tagWriter.calls.empty());
}

TEST_F(IngestionPipelineTest, FailedRecordSkipsTaggingAndMovesOn) {
    auto items = episodes(3, 1);
    serveAll(items);

    // Make the ledger refuse one insert with a non-duplicate error
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open((dir / "downloads.db").string().c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db,
                           "CREATE TRIGGER reject_guid_2 BEFORE INSERT ON episodes "
                           "WHEN NEW.guid = 'guid-2' BEGIN SELECT RAISE(ABORT, 'disk quota exceeded'); END;",
                           nullptr, nullptr, nullptr),
              SQLITE_OK);
    sqlite3_close(db);

    PipelineOptions options;
    options.saveText = true;
    IngestionSummary summary;
    ASSERT_NO_THROW(summary = runFeed(rssFeed("Example Show", items), options));

    EXPECT_EQ(summary.pending, 3u);
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.recordFailures, 1u);
    EXPECT_EQ(summary.duplicates, 0u);
    EXPECT_EQ(recordedGuids(summary.feedId), (std::set<std::string>{"guid-1", "guid-3"}));

    ASSERT_EQ(tagWriter.calls.size(), 2u);
    EXPECT_EQ(tagWriter.calls[0].file, archive() / "2024-06-13_episode_3.mp3");
    EXPECT_EQ(tagWriter.calls[1].file, archive() / "2024-06-11_episode_1.mp3");
    EXPECT_FALSE(std::filesystem::exists(archive() / "2024-06-12_episode_2.mp3.txt"));
    EXPECT_TRUE(std::filesystem::exists(archive() / "2024-06-11_episode_1.mp3.txt"));
}

TEST_F(IngestionPipelineTest, UncreatableTargetDirectoryIsFatal) {
    writeFile(dir / "occupied", "not a directory");
    IngestionPipeline pipeline(*ledger, parser, *transfer, tagWriter, logger, {}, sleeper.sleeper());

    EXPECT_THROW(pipeline.run(kFeedUrl, rssFeed("Example Show", episodes(1, 1)), dir / "occupied" / "show"),
                 TargetDirectoryError);
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(IngestionPipelineTest, FailedItemDoesNotStopTheBatch) {
    auto items = episodes(3, 1);
    serveAll(items);
    http.serve(episode(2).url, statusResponse(500));

    IngestionSummary summary = runFeed(rssFeed("Example Show", items));

    EXPECT_EQ(summary.pending, 3u);
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.failedTransfers, 1u);
    EXPECT_EQ(recordedGuids(summary.feedId), (std::set<std::string>{"guid-1", "guid-3"}));
    // pause, backoff 2s and 4s for the failing item, pause
    EXPECT_EQ(sleeper.waits, (std::vector<seconds>{seconds(1), seconds(2), seconds(4), seconds(1)}));

    // The failed episode is picked up by the next run
    http.serve(episode(2).url, okResponse("late"));
    IngestionSummary retry = runFeed(rssFeed("Example Show", items));
    EXPECT_EQ(retry.pending, 1u);
    EXPECT_EQ(retry.succeeded, 1u);
}

TEST_F(IngestionPipelineTest, PausesOnlyBetweenConsecutiveDownloads) {
    auto items = episodes(3, 1);
    serveAll(items);
    PipelineOptions options;
    options.interItemDelay = seconds(5);

    runFeed(rssFeed("Example Show", items), options);

    EXPECT_EQ(sleeper.waits, (std::vector<seconds>{seconds(5), seconds(5)}));
}

TEST_F(IngestionPipelineTest, SingleDownloadDoesNotPause) {
    auto items = episodes(1, 1);
    serveAll(items);

    runFeed(rssFeed("Example Show", items));

    EXPECT_TRUE(sleeper.waits.empty());
}

TEST_F(IngestionPipelineTest, TagsComeFromEntryAndFeed) {
    RssItem withAuthor = episode(2);
    withAuthor.author = "Guest";
    withAuthor.description = "All about things";
    RssItem withoutAuthor = episode(1);
    serveAll({withAuthor, withoutAuthor});

    runFeed(rssFeed("Example Show", {withAuthor, withoutAuthor}, "Host", "Technology"));

    ASSERT_EQ(tagWriter.calls.size(), 2u);
    const EpisodeTags& first = tagWriter.calls[0].tags;
    EXPECT_EQ(first.album.value_or(""), "Example Show");
    EXPECT_EQ(first.artist.value_or(""), "Guest");
    EXPECT_EQ(first.title.value_or(""), "Episode 2");
    EXPECT_EQ(first.releaseDate.value_or(""), "2024-06-12T09:00:00");
    EXPECT_EQ(first.comment.value_or(""), "All about things");
    EXPECT_EQ(first.genre.value_or(""), "Technology");
    EXPECT_EQ(tagWriter.calls[0].file, archive() / "2024-06-12_episode_2.mp3");

    const EpisodeTags& second = tagWriter.calls[1].tags;
    EXPECT_EQ(second.artist.value_or(""), "Host");
    EXPECT_FALSE(second.comment.has_value());
}

TEST_F(IngestionPipelineTest, OnlyMp3FilesAreTagged) {
    RssItem item = episode(1);
    item.url = "https://cdn.example.com/ep1.M4A";
    serveAll({item});

    IngestionSummary summary = runFeed(rssFeed("Example Show", {item}));

    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_TRUE(tagWriter.calls.empty());
}

TEST_F(IngestionPipelineTest, TagFailureKeepsFileAndLedgerRow) {
    auto items = episodes(1, 1);
    serveAll(items);
    tagWriter.failWith = "Could not open file for tagging";

    IngestionSummary summary = runFeed(rssFeed("Example Show", items));

    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_EQ(ledger->countEpisodes(summary.feedId), 1);
    EXPECT_EQ(archivedAudioFiles(), 1);
}

TEST_F(IngestionPipelineTest, WritesCompanionTextWhenAsked) {
    RssItem item = episode(1);
    item.description = "Show notes";
    serveAll({item});
    PipelineOptions options;
    options.saveText = true;

    runFeed(rssFeed("Example Show", {item}), options);

    const auto sidecar = archive() / "2024-06-11_episode_1.mp3.txt";
    ASSERT_TRUE(std::filesystem::exists(sidecar));
    EXPECT_EQ(readFile(sidecar),
              "Title: Episode 1\n"
              "Subtitle: N/A\n"
              "Published Date: Mon, 11 Jun 2024 09:00:00 GMT\n"
              "Content: Show notes\n");
}

TEST_F(IngestionPipelineTest, NoCompanionTextByDefault) {
    auto items = episodes(1, 1);
    serveAll(items);

    runFeed(rssFeed("Example Show", items));

    EXPECT_FALSE(std::filesystem::exists(archive() / "2024-06-11_episode_1.mp3.txt"));
}

TEST_F(IngestionPipelineTest, RecordsPublicationAndProvenance) {
    auto items = episodes(1, 1);
    serveAll(items);

    IngestionSummary summary = runFeed(rssFeed("Example Show", items));

    auto records = ledger->listEpisodes(summary.feedId);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].title, "Episode 1");
    EXPECT_EQ(records[0].publishedIso, "2024-06-11T09:00:00");
    EXPECT_EQ(records[0].filePath, (archive() / "2024-06-11_episode_1.mp3").string());
    EXPECT_EQ(records[0].ingestedAtIso.size(), 26u);
    EXPECT_EQ(ledger->findFeed(kFeedUrl)->title, "Example Show");
}

TEST_F(IngestionPipelineTest, UnparseableFeedIsFatal) {
    EXPECT_THROW(runFeed("<html>Access denied</html>"), FeedParseError);
    EXPECT_FALSE(ledger->findFeed(kFeedUrl).has_value());
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(IngestionPipelineTest, FeedWithoutAudioCompletesWithZeroCounts) {
    RssItem video = episode(1);
    video.type = "video/mp4";

    IngestionSummary summary = runFeed(rssFeed("Example Show", {video}));

    EXPECT_EQ(summary.totalCandidates, 0u);
    EXPECT_EQ(summary.pending, 0u);
    EXPECT_EQ(summary.succeeded, 0u);
    EXPECT_TRUE(std::filesystem::exists(archive()));
}

TEST_F(IngestionPipelineTest, UntitledFeedIsRegisteredAsUnknown) {
    FeedDocument feed;
    IngestionSummary summary = runDocument(feed);

    EXPECT_EQ(ledger->findFeed(kFeedUrl)->title, "N/A");
    EXPECT_EQ(summary.succeeded, 0u);
}

TEST(DeriveExtensionTest, UsesDecodedUrlPath) {
    EXPECT_EQ(deriveExtension("https://cdn.example.com/a/b/episode.mp3", "audio/mpeg"), ".mp3");
    EXPECT_EQ(deriveExtension("https://cdn.example.com/ep.m4a?download=1#t=10", "audio/mpeg"), ".m4a");
    EXPECT_EQ(deriveExtension("https://cdn.example.com/my%20show.ogg", "audio/ogg"), ".ogg");
    EXPECT_EQ(deriveExtension("https://cdn.example.com/v1.2/stream", "audio/mpeg"), ".mp3");
    EXPECT_EQ(deriveExtension("https://cdn.example.com/.hidden", "audio/mpeg"), ".mp3");
    EXPECT_EQ(deriveExtension("https://cdn.example.com/", "application/octet-stream"), "");
}

TEST(DeriveExtensionTest, PercentDecodesSafely) {
    EXPECT_EQ(percentDecode("file%201.mp3"), "file 1.mp3");
    EXPECT_EQ(percentDecode("100%"), "100%");
    EXPECT_EQ(percentDecode("%zz%4"), "%zz%4");
}
