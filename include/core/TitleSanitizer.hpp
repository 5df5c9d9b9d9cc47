#pragma once

#include "core/Logging.hpp"
#include <ctime>
#include <optional>
#include <string>

namespace podarchive {
namespace core {

// Turns an episode title into a filesystem-safe base name made only of
// [a-z0-9._-], never starting or ending with '_' or '-'.
//
// When `publishedDate` parses against one of the accepted RSS date formats
// the name is prefixed with "YYYY-MM-DD_". A date that doesn't parse is
// logged as a warning and otherwise ignored. If the title sanitizes to
// nothing, `fallback` (typically the episode GUID) is sanitized instead,
// and "episode" is used as a last resort.
std::string sanitizeTitle(const std::string& title,
                          const std::optional<std::string>& publishedDate = std::nullopt,
                          const std::string& fallback = "",
                          const Logger& logger = nullptr);

// NFKD-decomposes UTF-8 text and keeps only the ASCII code points, so
// accented letters fold to their base letter and everything without an
// ASCII decomposition is dropped. Throws std::runtime_error if ICU fails.
std::string foldToAscii(const std::string& text);

// Parses `text` against the filename date formats, in order:
//   "%a, %d %b %Y %H:%M:%S <zone name>"
//   "%a, %d %b %Y %H:%M:%S <+HHMM or +HH:MM>"
//   "%a, %d %b %Y %H:%M:%S"
// The date is taken as written, without zone conversion. Dates that don't
// exist on the calendar (31 Feb) are rejected.
std::optional<std::tm> parseFilenameDate(const std::string& text);

} // namespace core
} // namespace podarchive
