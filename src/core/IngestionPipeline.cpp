#include "core/IngestionPipeline.hpp"
#include "core/DateTime.hpp"
#include "core/TitleSanitizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <utility>
#include <ada.h>

namespace podarchive {
namespace core {

namespace {

const std::map<std::string, std::string> kCanonicalExtensions = {
    {"audio/mpeg", ".mp3"},
    {"audio/mp3", ".mp3"},
    {"audio/mp4", ".m4a"},
    {"audio/x-m4a", ".m4a"},
    {"audio/aac", ".aac"},
    {"audio/ogg", ".ogg"},
    {"audio/opus", ".opus"},
    {"audio/wav", ".wav"},
    {"audio/x-wav", ".wav"},
    {"audio/flac", ".flac"},
};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string urlPathname(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    if (parsed) {
        return std::string(parsed->get_pathname());
    }

    // Not a valid absolute URL; cut the query and fragment by hand
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }
    return path;
}

bool endsWithIgnoreCase(const std::string& text, const std::string& suffix) {
    if (suffix.size() > text.size()) {
        return false;
    }
    return std::equal(suffix.rbegin(), suffix.rend(), text.rbegin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string orNotAvailable(const std::string& value) {
    return value.empty() ? "N/A" : value;
}

} // namespace

std::string resolveGuid(const FeedEntry& entry, const EnclosureLink& link) {
    if (entry.guid && !entry.guid->empty()) {
        return *entry.guid;
    }
    return link.href;
}

std::vector<CandidateWorkItem> expandCandidates(const FeedDocument& feed, const std::string& audioType) {
    std::vector<CandidateWorkItem> candidates;
    for (const auto& entry : feed.entries) {
        for (const auto& link : entry.links) {
            if (link.type != audioType) {
                continue;
            }
            CandidateWorkItem item;
            item.entry = &entry;
            item.link = link;
            item.guid = resolveGuid(entry, link);
            candidates.push_back(item);
        }
    }
    return candidates;
}

std::string percentDecode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int high = hexValue(text[i + 1]);
            int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        decoded += text[i];
    }
    return decoded;
}

std::string deriveExtension(const std::string& url, const std::string& type) {
    const std::string path = percentDecode(urlPathname(url));
    const auto slash = path.find_last_of('/');
    const std::string basename = slash == std::string::npos ? path : path.substr(slash + 1);

    // Leading dots belong to the name, as in ".hidden"
    const auto dot = basename.find_last_of('.');
    const auto firstNonDot = basename.find_first_not_of('.');
    if (dot != std::string::npos && firstNonDot != std::string::npos && firstNonDot < dot) {
        return basename.substr(dot);
    }

    auto canonical = kCanonicalExtensions.find(type);
    if (canonical != kCanonicalExtensions.end()) {
        return canonical->second;
    }
    return "";
}

EpisodeTags buildTags(const FeedDocument& feed, const FeedEntry& entry) {
    EpisodeTags tags;
    if (!feed.title.empty()) {
        tags.album = feed.title;
    }
    if (entry.author && !entry.author->empty()) {
        tags.artist = entry.author;
    } else if (feed.author && !feed.author->empty()) {
        tags.artist = feed.author;
    }
    if (!entry.title.empty()) {
        tags.title = entry.title;
    }
    if (entry.publishedTime) {
        tags.releaseDate = formatIsoSeconds(*entry.publishedTime);
    }
    if (!entry.summary.empty()) {
        tags.comment = entry.summary;
    }
    if (!feed.categories.empty()) {
        tags.genre = feed.categories.front();
    }
    return tags;
}

void writeCompanionText(const std::filesystem::path& audioFile, const FeedEntry& entry, const Logger& logger) {
    std::filesystem::path textFile = audioFile;
    textFile += ".txt";

    std::ofstream file(textFile, std::ios::trunc);
    if (!file.is_open()) {
        logger->error("Could not open file for writing: {}", textFile.string());
        return;
    }
    file << "Title: " << orNotAvailable(entry.title) << "\n";
    file << "Subtitle: " << orNotAvailable(entry.subtitle) << "\n";
    file << "Published Date: " << orNotAvailable(entry.publishedText.value_or("")) << "\n";
    file << "Content: " << orNotAvailable(entry.summary) << "\n";
    file.close();
    if (!file) {
        logger->error("Failed writing episode details to {}", textFile.string());
    }
}

IngestionPipeline::IngestionPipeline(LedgerStore& ledger,
                                     ParsesFeed& parser,
                                     TransferEngine& transfer,
                                     WritesTags& tagWriter,
                                     Logger logger,
                                     PipelineOptions options,
                                     Sleeper sleeper)
    : ledger_(ledger),
      parser_(parser),
      transfer_(transfer),
      tagWriter_(tagWriter),
      logger_(std::move(logger)),
      options_(std::move(options)),
      sleeper_(std::move(sleeper)) {
}

IngestionSummary IngestionPipeline::run(const std::string& feedUrl,
                                        const std::string& feedBytes,
                                        const std::filesystem::path& targetDir) {
    const FeedDocument feed = parser_.parse(feedBytes);

    IngestionSummary summary;
    summary.feedId = ledger_.resolveFeed(feedUrl, feed.title.empty() ? "N/A" : feed.title);

    std::error_code ec;
    std::filesystem::create_directories(targetDir, ec);
    if (ec) {
        throw TargetDirectoryError("Could not create directory " + targetDir.string() + ": " + ec.message());
    }

    std::vector<CandidateWorkItem> candidates = expandCandidates(feed, options_.audioType);
    summary.totalCandidates = candidates.size();

    // The window applies before dedup: "N most recent in the feed", not
    // "N new downloads".
    if (options_.maxEpisodes) {
        logger_->info("Episode window set to {}. Considering only the latest {} episodes from the feed.",
                      *options_.maxEpisodes, *options_.maxEpisodes);
        if (candidates.size() > *options_.maxEpisodes) {
            candidates.resize(*options_.maxEpisodes);
        }
    }
    summary.considered = candidates.size();

    std::vector<CandidateWorkItem> pending;
    for (const auto& item : candidates) {
        if (!ledger_.hasEpisode(summary.feedId, item.guid)) {
            pending.push_back(item);
        }
    }
    summary.pending = pending.size();

    logger_->info("Found {} total episodes. Considering {}. Found {} new episodes to download.",
                  summary.totalCandidates, summary.considered, summary.pending);

    for (size_t i = 0; i < pending.size(); ++i) {
        logger_->info("Downloading audio file {} of {}: {}", i + 1, pending.size(), pending[i].entry->title);
        processCandidate(feed, summary.feedId, pending[i], targetDir, summary);

        if (i + 1 < pending.size()) {
            logger_->info("Sleeping for {} second(s)...", options_.interItemDelay.count());
            sleeper_(options_.interItemDelay);
        }
    }

    logger_->info("Completed! Successfully downloaded {} / {} audio files", summary.succeeded, summary.pending);
    return summary;
}

void IngestionPipeline::processCandidate(const FeedDocument& feed,
                                         FeedId feedId,
                                         const CandidateWorkItem& item,
                                         const std::filesystem::path& targetDir,
                                         IngestionSummary& summary) {
    const FeedEntry& entry = *item.entry;
    const std::string name = sanitizeTitle(entry.title, entry.publishedText, item.guid, logger_);
    const std::filesystem::path destination = targetDir / (name + deriveExtension(item.link.href, item.link.type));

    TransferResult transfer = transfer_.fetch(item.link.href, destination, options_.maxAttempts);
    if (!transfer.ok) {
        ++summary.failedTransfers;
        return;
    }

    EpisodeRecord record;
    record.feedId = feedId;
    record.guid = item.guid;
    record.title = entry.title;
    record.publishedIso = entry.publishedTime ? formatIsoSeconds(*entry.publishedTime) : "";
    record.filePath = destination.string();
    record.ingestedAtIso = nowIsoLocal();

    switch (ledger_.recordEpisode(record)) {
        case RecordOutcome::Recorded:
            ++summary.succeeded;
            break;
        case RecordOutcome::Duplicate:
            ++summary.duplicates;
            return;
        case RecordOutcome::Failed:
            ++summary.recordFailures;
            return;
    }

    if (endsWithIgnoreCase(destination.string(), ".mp3")) {
        tagEpisode(destination, feed, entry);
    }

    if (options_.saveText) {
        writeCompanionText(destination, entry, logger_);
    }
}

void IngestionPipeline::tagEpisode(const std::filesystem::path& file, const FeedDocument& feed, const FeedEntry& entry) {
    EpisodeTags tags = buildTags(feed, entry);
    if (!tags.artist) {
        logger_->debug("No author for '{}'; artist tag left unset", entry.title);
    }
    try {
        tagWriter_.write(file, tags);
    } catch (const TagWriteError& e) {
        logger_->error("{}", e.what());
    }
}

} // namespace core
} // namespace podarchive
