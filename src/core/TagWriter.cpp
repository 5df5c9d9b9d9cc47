#include "core/TagWriter.hpp"
#include <utility>
#include <taglib/mpegfile.h>
#include <taglib/tpropertymap.h>
#include <taglib/tstring.h>

namespace podarchive {
namespace core {

namespace {

void setProperty(TagLib::PropertyMap& properties, const char* key, const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return;
    }
    properties.replace(key, TagLib::StringList(TagLib::String(*value, TagLib::String::UTF8)));
}

} // namespace

TagLibTagWriter::TagLibTagWriter(Logger logger)
    : logger_(std::move(logger)) {
}

void TagLibTagWriter::write(const std::filesystem::path& file, const EpisodeTags& tags) {
    TagLib::MPEG::File audio(file.c_str());
    if (!audio.isValid()) {
        throw TagWriteError("Could not open file for tagging: " + file.string());
    }

    TagLib::PropertyMap properties = audio.properties();
    setProperty(properties, "ALBUM", tags.album);
    setProperty(properties, "ARTIST", tags.artist);
    setProperty(properties, "ALBUMARTIST", tags.artist);
    setProperty(properties, "TITLE", tags.title);
    setProperty(properties, "DATE", tags.releaseDate);
    setProperty(properties, "COMMENT", tags.comment);
    setProperty(properties, "GENRE", tags.genre);

    TagLib::PropertyMap rejected = audio.setProperties(properties);
    if (!rejected.isEmpty()) {
        logger_->debug("Some tags were not supported by {}: {}", file.string(), rejected.toString().to8Bit(true));
    }

    if (!audio.save()) {
        throw TagWriteError("Could not save tags to " + file.string());
    }
    logger_->info("Successfully set MP3 tags for: {}", file.string());
}

} // namespace core
} // namespace podarchive
