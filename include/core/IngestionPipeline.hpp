#pragma once

#include "core/LedgerStore.hpp"
#include "core/Logging.hpp"
#include "core/PodcastFeed.hpp"
#include "core/TagWriter.hpp"
#include "core/TransferEngine.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace podarchive {
namespace core {

// The directory episodes are saved into could not be created.
class TargetDirectoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PipelineOptions {
    bool saveText = false;                   // write a <file>.txt sidecar per episode
    std::optional<std::size_t> maxEpisodes;  // consider only the first N candidates
    int maxAttempts = TransferEngine::kDefaultMaxAttempts;
    std::chrono::seconds interItemDelay{1};
    std::string audioType = "audio/mpeg";
};

struct IngestionSummary {
    FeedId feedId = 0;
    std::size_t totalCandidates = 0;
    std::size_t considered = 0;  // after the maxEpisodes window
    std::size_t pending = 0;     // considered and not yet in the ledger
    std::size_t succeeded = 0;   // downloaded and newly recorded
    std::size_t failedTransfers = 0;
    std::size_t duplicates = 0;
    std::size_t recordFailures = 0;
};

// One enclosure of one entry awaiting dedup and transfer.
struct CandidateWorkItem {
    const FeedEntry* entry = nullptr;
    EnclosureLink link;
    std::string guid;
};

// The feed's identifier when it has one, the enclosure URL otherwise.
std::string resolveGuid(const FeedEntry& entry, const EnclosureLink& link);

// Every (entry, link) pair whose link type is `audioType`, in feed order.
std::vector<CandidateWorkItem> expandCandidates(const FeedDocument& feed, const std::string& audioType);

// File extension (with the dot) taken from the URL path, or the canonical
// extension for `type` when the path has none.
std::string deriveExtension(const std::string& url, const std::string& type);

std::string percentDecode(const std::string& text);

EpisodeTags buildTags(const FeedDocument& feed, const FeedEntry& entry);

// Writes title, subtitle, published date and summary to <audioFile>.txt.
// Failures are logged.
void writeCompanionText(const std::filesystem::path& audioFile, const FeedEntry& entry, const Logger& logger);

// Takes a fetched feed through parse, candidate expansion, windowing,
// dedup against the ledger, transfer, record, tagging and the optional
// sidecar. Items are processed strictly one after another with a pause
// between consecutive downloads.
class IngestionPipeline {
public:
    IngestionPipeline(LedgerStore& ledger,
                      ParsesFeed& parser,
                      TransferEngine& transfer,
                      WritesTags& tagWriter,
                      Logger logger,
                      PipelineOptions options = {},
                      Sleeper sleeper = sleepFor);

    // Throws FeedParseError if the feed can't be parsed, TargetDirectoryError
    // if `targetDir` can't be created and LedgerError if the ledger fails
    // outside a single record write. Per-item failures are logged and
    // counted in the summary; an item whose record write is a duplicate or
    // fails is neither tagged nor given a sidecar.
    IngestionSummary run(const std::string& feedUrl,
                         const std::string& feedBytes,
                         const std::filesystem::path& targetDir);

    const PipelineOptions& options() const { return options_; }

private:
    void processCandidate(const FeedDocument& feed,
                          FeedId feedId,
                          const CandidateWorkItem& item,
                          const std::filesystem::path& targetDir,
                          IngestionSummary& summary);

    void tagEpisode(const std::filesystem::path& file, const FeedDocument& feed, const FeedEntry& entry);

    LedgerStore& ledger_;
    ParsesFeed& parser_;
    TransferEngine& transfer_;
    WritesTags& tagWriter_;
    Logger logger_;
    PipelineOptions options_;
    Sleeper sleeper_;
};

} // namespace core
} // namespace podarchive
