#pragma once

#include "core/Logging.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace podarchive {
namespace core {

class TagWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Metadata written into a downloaded episode. Unset fields are left alone.
struct EpisodeTags {
    std::optional<std::string> album;        // feed title
    std::optional<std::string> artist;       // also written as album artist
    std::optional<std::string> title;
    std::optional<std::string> releaseDate;  // YYYY-MM-DDTHH:MM:SS
    std::optional<std::string> comment;
    std::optional<std::string> genre;
};

// Mutates the tag block of an audio file in place. Throws TagWriteError
// when the file can't be opened or saved.
class WritesTags {
public:
    virtual ~WritesTags() = default;
    virtual void write(const std::filesystem::path& file, const EpisodeTags& tags) = 0;
};

// ID3v2 writer for MPEG audio files.
class TagLibTagWriter : public WritesTags {
public:
    explicit TagLibTagWriter(Logger logger);

    void write(const std::filesystem::path& file, const EpisodeTags& tags) override;

private:
    Logger logger_;
};

} // namespace core
} // namespace podarchive
