#pragma once

#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <pugixml.hpp>

namespace podarchive {
namespace core {

class FeedParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EnclosureLink {
    std::string type;
    std::string href;
};

struct FeedEntry {
    std::string title;
    std::optional<std::string> guid;
    std::optional<std::string> publishedText;
    std::optional<std::tm> publishedTime;
    std::optional<std::string> author;
    std::string summary;
    std::string subtitle;
    std::vector<EnclosureLink> links;
};

struct FeedDocument {
    std::string title;
    std::optional<std::string> author;
    std::vector<std::string> categories;
    std::vector<FeedEntry> entries;  // feed order, newest first by convention
};

// Turns raw feed bytes into a FeedDocument. Throws FeedParseError when the
// bytes are not a feed at all.
class ParsesFeed {
public:
    virtual ~ParsesFeed() = default;
    virtual FeedDocument parse(const std::string& bytes) = 0;
};

// RSS 2.0 (with iTunes / Dublin Core extensions) and Atom parser.
class PugiFeedParser : public ParsesFeed {
public:
    PugiFeedParser() = default;
    ~PugiFeedParser() override = default;

    FeedDocument parse(const std::string& bytes) override;

private:
    FeedDocument parseRss(const pugi::xml_node& channel) const;
    FeedDocument parseAtom(const pugi::xml_node& feed) const;
    FeedEntry parseRssItem(const pugi::xml_node& item) const;
    FeedEntry parseAtomEntry(const pugi::xml_node& entry) const;
};

} // namespace core
} // namespace podarchive
