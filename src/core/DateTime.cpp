#include "core/DateTime.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <locale>
#include <map>
#include <sstream>

namespace podarchive {
namespace core {

namespace {

// Offsets in minutes east of UTC for the zone names RFC 822 allows.
const std::map<std::string, int> kZoneOffsets = {
    {"UT", 0}, {"UTC", 0}, {"GMT", 0}, {"Z", 0},
    {"EST", -5 * 60}, {"EDT", -4 * 60},
    {"CST", -6 * 60}, {"CDT", -5 * 60},
    {"MST", -7 * 60}, {"MDT", -6 * 60},
    {"PST", -8 * 60}, {"PDT", -7 * 60},
};

std::optional<int> parseNumericOffset(const std::string& zone) {
    if (zone.size() < 3 || (zone[0] != '+' && zone[0] != '-')) {
        return std::nullopt;
    }
    std::string digits;
    for (size_t i = 1; i < zone.size(); ++i) {
        if (zone[i] == ':') {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(zone[i]))) {
            return std::nullopt;
        }
        digits += zone[i];
    }
    if (digits.size() != 2 && digits.size() != 4) {
        return std::nullopt;
    }
    int hours = std::stoi(digits.substr(0, 2));
    int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    int offset = hours * 60 + minutes;
    return zone[0] == '-' ? -offset : offset;
}

std::optional<int> zoneOffsetMinutes(const std::string& zone) {
    if (zone.empty()) {
        return 0;
    }
    if (auto numeric = parseNumericOffset(zone)) {
        return numeric;
    }
    std::string upper = zone;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    auto it = kZoneOffsets.find(upper);
    if (it != kZoneOffsets.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::tm toUtc(std::tm local, int offsetMinutes) {
    local.tm_isdst = 0;
    std::time_t seconds = timegm(&local) - static_cast<std::time_t>(offsetMinutes) * 60;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return utc;
}

} // namespace

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

std::optional<std::tm> parseWithFormat(const std::string& text, const char* format, std::string* rest) {
    std::istringstream stream(text);
    stream.imbue(std::locale::classic());
    std::tm tm{};
    stream >> std::get_time(&tm, format);
    if (stream.fail()) {
        return std::nullopt;
    }
    if (rest) {
        std::string tail;
        std::getline(stream, tail, '\0');
        *rest = tail;
    }
    return tm;
}

std::optional<std::tm> parseRfc822(const std::string& text) {
    std::string value = trim(text);
    // Weekday is optional and ignored.
    auto comma = value.find(',');
    if (comma != std::string::npos) {
        value = trim(value.substr(comma + 1));
    }

    std::string rest;
    auto tm = parseWithFormat(value, "%d %b %Y %H:%M:%S", &rest);
    if (!tm) {
        tm = parseWithFormat(value, "%d %b %Y %H:%M", &rest);
    }
    if (!tm) {
        return std::nullopt;
    }

    auto offset = zoneOffsetMinutes(trim(rest));
    if (!offset) {
        return std::nullopt;
    }
    return toUtc(*tm, *offset);
}

std::optional<std::tm> parseIso8601(const std::string& text) {
    const std::string value = trim(text);
    std::string rest;
    auto tm = parseWithFormat(value, "%Y-%m-%dT%H:%M:%S", &rest);
    if (!tm) {
        tm = parseWithFormat(value, "%Y-%m-%d %H:%M:%S", &rest);
    }
    if (!tm) {
        tm = parseWithFormat(value, "%Y-%m-%d", &rest);
        if (!tm || !trim(rest).empty()) {
            return std::nullopt;
        }
        return toUtc(*tm, 0);
    }

    // Drop fractional seconds
    size_t pos = 0;
    if (pos < rest.size() && (rest[pos] == '.' || rest[pos] == ',')) {
        ++pos;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            ++pos;
        }
    }
    auto offset = zoneOffsetMinutes(trim(rest.substr(pos)));
    if (!offset) {
        return std::nullopt;
    }
    return toUtc(*tm, *offset);
}

std::optional<std::tm> parseFeedTimestamp(const std::string& text) {
    if (auto tm = parseRfc822(text)) {
        return tm;
    }
    return parseIso8601(text);
}

std::string formatIsoSeconds(const std::tm& tm) {
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return out.str();
}

std::string formatDate(const std::tm& tm) {
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}

std::string nowIsoLocal() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%06lld", static_cast<long long>(micros));
    return formatIsoSeconds(local) + fraction;
}

} // namespace core
} // namespace podarchive
