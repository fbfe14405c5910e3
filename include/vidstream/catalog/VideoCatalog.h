// vidstream/include/vidstream/catalog/VideoCatalog.h
#ifndef VIDSTREAM_CATALOG_VIDEOCATALOG_H
#define VIDSTREAM_CATALOG_VIDEOCATALOG_H

#include "vidstream/json/JsonValue.h"
#include <string>
#include <string_view>
#include <vector>

namespace Vidstream {
namespace Catalog {

struct Video {
    std::string id;
    std::string title;
    std::string description;
    std::string thumbnail_url; // Relative to the media root, e.g. "./thumbnails/metropolis.png"
    std::string video_url;     // Relative to the media root, e.g. "./videos/metropolis.mp4"
    std::string author;
    std::vector<std::string> tags;
    std::string duration;      // Seconds, as text ("12000.000")
};

// JSON shape served by GET /api and accepted in the config file's "videos" array
Json::JsonValue video_to_json(const Video& video);

// "id" is required; other fields default to empty. Throws std::runtime_error
// when the entry is not an object or a field has the wrong type.
Video video_from_json(const Json::JsonValue& j);

// Fixed list of videos, read-only once constructed; shared by every worker
// thread without locking.
class VideoCatalog {
public:
    VideoCatalog(std::vector<Video> videos, std::string media_root);

    // The catalog the server ships with
    static std::vector<Video> default_videos();

    const Video* find_by_id(std::string_view id) const;

    // Absolute or media-root-relative file locations. Empty when the entry
    // has no URL for it, which callers treat as not found.
    std::string video_path(const Video& video) const;
    std::string thumbnail_path(const Video& video) const;

    const std::vector<Video>& videos() const { return videos_; }
    const std::string& media_root() const { return media_root_; }

    Json::JsonValue to_json() const;

private:
    std::string resolve(const std::string& relative_url) const;

    std::vector<Video> videos_;
    std::string media_root_;
};

} // namespace Catalog
} // namespace Vidstream

#endif // VIDSTREAM_CATALOG_VIDEOCATALOG_H
