#include "core/Config.hpp"
#include "core/FeedManager.hpp"
#include "core/HttpClient.hpp"
#include "core/LedgerStore.hpp"
#include "core/Logging.hpp"
#include "core/PodcastFeed.hpp"
#include "core/Subscription.hpp"
#include "core/TagWriter.hpp"
#include "core/TransferEngine.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace podarchive::core;

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitFeedFetchFailed = 1,
    kExitUsage = 2,
    kExitLedgerFailed = 3,
    kExitFeedParseFailed = 4,
    kExitUnexpected = 5
};

struct CommandLine {
    std::vector<std::string> positional;
    std::optional<std::string> configFile;
    std::optional<std::string> database;
    std::optional<std::size_t> numEpisodes;
    bool saveText = false;
    bool verbose = false;
    bool help = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void printHelp() {
    std::cout << "\npodarchive - archive podcast episodes from RSS/Atom feeds\n"
              << "Usage: podarchive [options] <command> [arguments]\n\n"
              << "Commands:\n"
              << "  fetch <url> <dir>            - Download new episodes of one feed into <dir>\n"
              << "  <url> <dir>                  - Same as fetch\n"
              << "  add <name> <url> <dir>       - Add a podcast subscription\n"
              << "  remove <name>                - Remove a podcast subscription\n"
              << "  list                         - List all subscribed podcasts\n"
              << "  sync                         - Download new episodes of every subscription\n"
              << "  history <url>                - Show episodes already downloaded from a feed\n\n"
              << "Options:\n"
              << "  --save-text                  - Save a text file with extra episode details\n"
              << "  --num-episodes <N>           - Only consider the latest N episodes of the feed\n"
              << "  --config <file>              - Read settings from a JSON file\n"
              << "  --database <file>            - Override the download ledger location\n"
              << "  --verbose                    - Log debug output\n"
              << "  --help                       - Show this help\n\n"
              << "Include the authentication token in the feed URL if the feed requires one.\n\n";
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto nextValue = [&](const std::string& flag) {
            if (i + 1 >= argc) {
                throw UsageError("Missing value for " + flag);
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--save-text" || arg == "--save_text") {
            cmd.saveText = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (arg == "--config") {
            cmd.configFile = nextValue(arg);
        } else if (arg == "--database") {
            cmd.database = nextValue(arg);
        } else if (arg == "--num-episodes") {
            std::string value = nextValue(arg);
            try {
                size_t consumed = 0;
                long long n = std::stoll(value, &consumed);
                if (consumed != value.size() || n < 0) {
                    throw UsageError("--num-episodes expects a non-negative integer");
                }
                cmd.numEpisodes = static_cast<std::size_t>(n);
            } catch (const std::logic_error&) {
                throw UsageError("--num-episodes expects a non-negative integer, got '" + value + "'");
            }
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            throw UsageError("Unknown option: " + arg);
        } else {
            cmd.positional.push_back(arg);
        }
    }
    return cmd;
}

std::filesystem::path executableDirectory() {
    std::error_code ec;
    auto exe = std::filesystem::canonical("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe.parent_path();
}

void printPodcastList(const FeedManager& feedManager) {
    auto subscriptions = feedManager.getSubscriptions();
    if (subscriptions.empty()) {
        std::cout << "No podcasts subscribed.\n";
        return;
    }

    std::cout << "\nSubscribed Podcasts:\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& sub : subscriptions) {
        std::cout << std::left << std::setw(20) << sub.name
                  << " | " << sub.feedUrl << "\n"
                  << std::string(20, ' ') << " | -> " << sub.directory;
        if (sub.numEpisodes) {
            std::cout << " (latest " << *sub.numEpisodes << ")";
        }
        std::cout << "\n";
    }
    std::cout << std::string(60, '-') << "\n";
}

void printHistory(const LedgerStore& ledger, const std::string& feedUrl) {
    auto feed = ledger.findFeed(feedUrl);
    if (!feed) {
        std::cout << "Feed not in database: " << feedUrl << "\n";
        return;
    }

    auto episodes = ledger.listEpisodes(feed->id);
    std::cout << "\n" << feed->title << " (" << episodes.size() << " episodes)\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& episode : episodes) {
        std::cout << std::left << std::setw(20) << (episode.publishedIso.empty() ? "-" : episode.publishedIso)
                  << " " << episode.title << "\n"
                  << std::string(21, ' ') << episode.filePath << "\n";
    }
}

void requireArguments(const std::vector<std::string>& args, size_t count, const std::string& usage) {
    if (args.size() < count) {
        throw UsageError("Usage: " + usage);
    }
}

int runIngestion(const Config& config, const CommandLine& cmd, const std::string& command,
                 const std::vector<std::string>& args, FeedManager& feedManager, const Logger& logger) {
    // One ledger handle per run, closed when this scope unwinds
    LedgerStore ledger(config.database, logger);

    if (command == "history") {
        requireArguments(args, 1, "history <url>");
        printHistory(ledger, args[0]);
        return kExitOk;
    }

    CprHttpClient http(config.httpOptions(), logger);
    PugiFeedParser parser;
    TransferEngine transfer(http, logger);
    TagLibTagWriter tagWriter(logger);
    IngestionContext context{ledger, http, parser, transfer, tagWriter, config.pipelineOptions()};

    if (command == "sync") {
        switch (feedManager.syncAll(context)) {
            case SyncStatus::Ok:
                return kExitOk;
            case SyncStatus::FeedFetchFailed:
                return kExitFeedFetchFailed;
            case SyncStatus::FeedParseFailed:
                return kExitFeedParseFailed;
            case SyncStatus::TargetDirectoryFailed:
                return kExitUnexpected;
        }
        return kExitOk;
    }

    // fetch <url> <dir>
    requireArguments(args, 2, "fetch <url> <dir>");
    Subscription adHoc("", args[0], args[1]);
    adHoc.saveText = cmd.saveText;
    adHoc.numEpisodes = cmd.numEpisodes;
    try {
        feedManager.ingest(context, adHoc);
    } catch (const FeedFetchError&) {
        logger->error("Exiting...");
        return kExitFeedFetchFailed;
    } catch (const FeedParseError& e) {
        logger->error("Error parsing the RSS feed: {}", e.what());
        return kExitFeedParseFailed;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        printHelp();
        return kExitUsage;
    }

    if (cmd.help || cmd.positional.empty()) {
        printHelp();
        return cmd.help ? kExitOk : kExitUsage;
    }

    const std::filesystem::path baseDir = executableDirectory();
    Config config = Config::defaults(baseDir);
    try {
        if (cmd.configFile) {
            config = Config::load(*cmd.configFile, baseDir);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitUsage;
    }
    if (cmd.database) {
        config.database = *cmd.database;
    }
    if (cmd.verbose) {
        config.logLevel = "debug";
    }

    Logger logger = makeLogger("podarchive", config.logLevel);

    // A bare "<url> <dir>" is a fetch
    std::string command = cmd.positional[0];
    std::vector<std::string> args(cmd.positional.begin() + 1, cmd.positional.end());
    static const std::vector<std::string> kCommands = {"fetch", "add", "remove", "list", "sync", "history"};
    if (std::find(kCommands.begin(), kCommands.end(), command) == kCommands.end()) {
        command = "fetch";
        args = cmd.positional;
    }

    try {
        FeedManager feedManager(config.subscriptions, logger);

        if (command == "add") {
            requireArguments(args, 3, "add <name> <url> <dir>");
            Subscription sub(args[0], args[1], args[2]);
            sub.saveText = cmd.saveText;
            sub.numEpisodes = cmd.numEpisodes;
            return feedManager.addPodcast(sub) ? kExitOk : kExitUsage;
        }
        if (command == "remove") {
            requireArguments(args, 1, "remove <name>");
            return feedManager.removePodcast(args[0]) ? kExitOk : kExitUsage;
        }
        if (command == "list") {
            printPodcastList(feedManager);
            return kExitOk;
        }

        return runIngestion(config, cmd, command, args, feedManager, logger);
    }
    catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }
    catch (const LedgerError& e) {
        logger->error("Database error: {}", e.what());
        return kExitLedgerFailed;
    }
    catch (const std::exception& e) {
        logger->error("An unexpected error occurred: {}", e.what());
        return kExitUnexpected;
    }
}
