#include "core/TitleSanitizer.hpp"
#include "core/DateTime.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <unicode/errorcode.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>

namespace podarchive {
namespace core {

namespace {

bool isAllowed(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

bool isSeparator(char c) {
    return c == '_' || c == '-';
}

std::string cleanName(const std::string& text) {
    const std::string ascii = foldToAscii(text);

    std::string cleaned;
    cleaned.reserve(ascii.size());
    for (char c : ascii) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            c = '_';
        }
        if (!isAllowed(c)) {
            continue;
        }
        // Collapse "__" and "--" runs; "_-" stays as is
        if (isSeparator(c) && !cleaned.empty() && cleaned.back() == c) {
            continue;
        }
        cleaned += c;
    }

    const auto first = std::find_if_not(cleaned.begin(), cleaned.end(), isSeparator);
    const auto last = std::find_if_not(cleaned.rbegin(), cleaned.rend(), isSeparator).base();
    if (first >= last) {
        return "";
    }

    std::string result(first, last);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool isZoneName(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isalpha(c); });
}

bool isDigits(std::string::const_iterator first, std::string::const_iterator last) {
    return std::all_of(first, last, [](unsigned char c) { return std::isdigit(c); });
}

// +HHMM or +HH:MM
bool isZoneOffset(const std::string& text) {
    if (text.empty() || (text[0] != '+' && text[0] != '-')) {
        return false;
    }
    if (text.size() == 5) {
        return isDigits(text.begin() + 1, text.end());
    }
    return text.size() == 6 && text[3] == ':' &&
           isDigits(text.begin() + 1, text.begin() + 3) && isDigits(text.begin() + 4, text.end());
}

// std::get_time accepts "31 Feb"; a real calendar date survives a
// round trip through timegm unchanged.
bool isCalendarDate(const std::tm& tm) {
    std::tm copy = tm;
    copy.tm_isdst = 0;
    const std::time_t seconds = timegm(&copy);
    std::tm normalized{};
    if (gmtime_r(&seconds, &normalized) == nullptr) {
        return false;
    }
    return normalized.tm_year == tm.tm_year && normalized.tm_mon == tm.tm_mon &&
           normalized.tm_mday == tm.tm_mday;
}

} // namespace

std::string foldToAscii(const std::string& text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    if (U_FAILURE(status) || nfkd == nullptr) {
        throw std::runtime_error("ICU: failed to get NFKD normalizer");
    }

    // Malformed UTF-8 becomes U+FFFD and is dropped below
    const icu::UnicodeString input = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    icu::UnicodeString decomposed;
    status = U_ZERO_ERROR;
    nfkd->normalize(input, decomposed, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("ICU: NFKD normalize failed: ") + u_errorName(status));
    }

    // Base letters survive decomposition; marks and non-Latin scripts don't
    std::string out;
    out.reserve(text.size());
    for (int32_t i = 0; i < decomposed.length(); i = decomposed.moveIndex32(i, 1)) {
        const UChar32 cp = decomposed.char32At(i);
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        }
    }
    return out;
}

std::optional<std::tm> parseFilenameDate(const std::string& text) {
    const std::string value = trim(text);
    std::string rest;
    auto tm = parseWithFormat(value, "%a, %d %b %Y %H:%M:%S", &rest);
    if (!tm || !isCalendarDate(*tm)) {
        return std::nullopt;
    }

    // Zone name, numeric offset, or nothing at all
    const std::string zone = trim(rest);
    if (isZoneName(zone) || isZoneOffset(zone) || zone.empty()) {
        return tm;
    }
    return std::nullopt;
}

std::string sanitizeTitle(const std::string& title,
                          const std::optional<std::string>& publishedDate,
                          const std::string& fallback,
                          const Logger& logger) {
    std::string name = cleanName(title);
    if (name.empty()) {
        name = cleanName(fallback);
    }
    if (name.empty()) {
        name = "episode";
    }

    if (publishedDate && !publishedDate->empty()) {
        if (auto date = parseFilenameDate(*publishedDate)) {
            name = formatDate(*date) + "_" + name;
        } else if (logger) {
            logger->warn("Could not parse date: '{}'. Filename will not have a date prefix.", *publishedDate);
        }
    }

    return name;
}

} // namespace core
} // namespace podarchive
