#include "core/PodcastFeed.hpp"
#include "core/DateTime.hpp"
#include <cstring>
#include <initializer_list>
#include <utility>

namespace podarchive {
namespace core {

namespace {

std::optional<std::string> childText(const pugi::xml_node& node, const char* name) {
    auto child = node.child(name);
    if (!child) {
        return std::nullopt;
    }
    std::string text = trim(child.text().get());
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

// First non-empty child text among `names`, in priority order.
std::optional<std::string> firstChildText(const pugi::xml_node& node, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (auto text = childText(node, name)) {
            return text;
        }
    }
    return std::nullopt;
}

void setPublished(FeedEntry& entry, std::optional<std::string> text) {
    entry.publishedText = std::move(text);
    if (entry.publishedText) {
        entry.publishedTime = parseFeedTimestamp(*entry.publishedText);
    }
}

} // namespace

FeedDocument PugiFeedParser::parse(const std::string& bytes) {
    if (bytes.empty()) {
        throw FeedParseError("Empty feed document");
    }

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(bytes.data(), bytes.size());
    if (!result) {
        throw FeedParseError("Failed to parse XML feed: " + std::string(result.description()));
    }

    // Find the channel - try both RSS and Atom formats
    if (auto channel = doc.child("rss").child("channel")) {
        return parseRss(channel);
    }
    if (auto feed = doc.child("feed")) {
        return parseAtom(feed);
    }

    throw FeedParseError("Invalid podcast feed format: no channel or feed element found");
}

FeedDocument PugiFeedParser::parseRss(const pugi::xml_node& channel) const {
    FeedDocument feed;
    feed.title = childText(channel, "title").value_or("");
    feed.author = firstChildText(channel, {"itunes:author", "author", "managingEditor", "dc:creator"});

    // Plain and iTunes categories in document order
    for (auto child : channel.children()) {
        if (std::strcmp(child.name(), "category") == 0) {
            std::string term = trim(child.text().get());
            if (!term.empty()) {
                feed.categories.push_back(term);
            }
        } else if (std::strcmp(child.name(), "itunes:category") == 0) {
            std::string term = trim(child.attribute("text").value());
            if (!term.empty()) {
                feed.categories.push_back(term);
            }
        }
    }

    for (auto item : channel.children("item")) {
        feed.entries.push_back(parseRssItem(item));
    }
    return feed;
}

FeedEntry PugiFeedParser::parseRssItem(const pugi::xml_node& item) const {
    FeedEntry entry;
    entry.title = childText(item, "title").value_or("");
    entry.guid = childText(item, "guid");
    setPublished(entry, firstChildText(item, {"pubDate", "dc:date"}));
    entry.author = firstChildText(item, {"author", "itunes:author", "dc:creator"});
    entry.summary = firstChildText(item, {"description", "itunes:summary"}).value_or("");
    entry.subtitle = childText(item, "itunes:subtitle").value_or("");

    for (auto enclosure : item.children("enclosure")) {
        EnclosureLink link;
        link.href = trim(enclosure.attribute("url").value());
        link.type = trim(enclosure.attribute("type").value());
        if (!link.href.empty()) {
            entry.links.push_back(link);
        }
    }
    return entry;
}

FeedDocument PugiFeedParser::parseAtom(const pugi::xml_node& feedNode) const {
    FeedDocument feed;
    feed.title = childText(feedNode, "title").value_or("");
    if (auto author = feedNode.child("author")) {
        feed.author = childText(author, "name");
    }

    for (auto category : feedNode.children("category")) {
        std::string term = trim(category.attribute("term").value());
        if (!term.empty()) {
            feed.categories.push_back(term);
        }
    }

    for (auto entryNode : feedNode.children("entry")) {
        feed.entries.push_back(parseAtomEntry(entryNode));
    }
    return feed;
}

FeedEntry PugiFeedParser::parseAtomEntry(const pugi::xml_node& entryNode) const {
    FeedEntry entry;
    entry.title = childText(entryNode, "title").value_or("");
    entry.guid = childText(entryNode, "id");
    setPublished(entry, firstChildText(entryNode, {"published", "updated"}));
    if (auto author = entryNode.child("author")) {
        entry.author = childText(author, "name");
    }
    entry.summary = firstChildText(entryNode, {"summary", "content"}).value_or("");
    entry.subtitle = childText(entryNode, "itunes:subtitle").value_or("");

    for (auto linkNode : entryNode.children("link")) {
        if (std::string(linkNode.attribute("rel").value()) != "enclosure") {
            continue;
        }
        EnclosureLink link;
        link.href = trim(linkNode.attribute("href").value());
        link.type = trim(linkNode.attribute("type").value());
        if (!link.href.empty()) {
            entry.links.push_back(link);
        }
    }
    return entry;
}

} // namespace core
} // namespace podarchive
