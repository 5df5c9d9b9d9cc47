#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace podarchive {
namespace core {

// Parse `text` against a strftime-style `format` using the classic locale.
// On success the unparsed tail (possibly empty) is stored in `rest`.
std::optional<std::tm> parseWithFormat(const std::string& text, const char* format, std::string* rest = nullptr);

// RFC 822 / RFC 2822 dates as found in RSS <pubDate>, normalised to UTC.
std::optional<std::tm> parseRfc822(const std::string& text);

// ISO 8601 dates as found in Atom <published>/<updated>, normalised to UTC.
std::optional<std::tm> parseIso8601(const std::string& text);

// Tries RFC 822 first, then ISO 8601.
std::optional<std::tm> parseFeedTimestamp(const std::string& text);

std::string formatIsoSeconds(const std::tm& tm);  // YYYY-MM-DDTHH:MM:SS
std::string formatDate(const std::tm& tm);        // YYYY-MM-DD

// Current local time as YYYY-MM-DDTHH:MM:SS.ffffff
std::string nowIsoLocal();

std::string trim(const std::string& text);

} // namespace core
} // namespace podarchive
