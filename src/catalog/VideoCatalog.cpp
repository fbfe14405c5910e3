// vidstream/src/catalog/VideoCatalog.cpp
#include "vidstream/catalog/VideoCatalog.h"
#include <filesystem>
#include <stdexcept>

namespace Vidstream {
namespace Catalog {

namespace {

std::string optional_string(const Json::JsonValue& j, const std::string& key) {
    const Json::JsonValue* field = j.find(key);
    if (!field || field->is_null()) {
        return std::string();
    }
    if (!field->is_string()) {
        throw std::runtime_error("Video field '" + key + "' must be a string");
    }
    return field->get_string();
}

} // namespace

Json::JsonValue video_to_json(const Video& video) {
    Json::JsonValue j = Json::JsonValue::object();
    j["id"] = video.id;
    j["title"] = video.title;
    j["description"] = video.description;
    j["thumbnailUrl"] = video.thumbnail_url;
    j["videoUrl"] = video.video_url;
    j["author"] = video.author;
    Json::JsonValue tags = Json::JsonValue::array();
    for (const std::string& tag : video.tags) {
        tags.push_back(tag);
    }
    j["tags"] = std::move(tags);
    j["duration"] = video.duration;
    return j;
}

Video video_from_json(const Json::JsonValue& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Video entry must be a JSON object");
    }
    const Json::JsonValue* id = j.find("id");
    if (!id || !id->is_string() || id->get_string().empty()) {
        throw std::runtime_error("Video entry needs a non-empty string 'id'");
    }

    Video video;
    video.id = id->get_string();
    video.title = optional_string(j, "title");
    video.description = optional_string(j, "description");
    video.thumbnail_url = optional_string(j, "thumbnailUrl");
    video.video_url = optional_string(j, "videoUrl");
    video.author = optional_string(j, "author");
    video.duration = optional_string(j, "duration");

    const Json::JsonValue* tags = j.find("tags");
    if (tags && !tags->is_null()) {
        if (!tags->is_array()) {
            throw std::runtime_error("Video field 'tags' must be an array of strings");
        }
        for (const Json::JsonValue& tag : tags->get_array()) {
            if (!tag.is_string()) {
                throw std::runtime_error("Video field 'tags' must be an array of strings");
            }
            video.tags.push_back(tag.get_string());
        }
    }
    return video;
}

VideoCatalog::VideoCatalog(std::vector<Video> videos, std::string media_root)
    : videos_(std::move(videos)), media_root_(std::move(media_root)) {}

std::vector<Video> VideoCatalog::default_videos() {
    Video metropolis;
    metropolis.id = "1";
    metropolis.title = "Metropolis";
    metropolis.description = "Metropolis, the 1927 silent film directed by Fritz Lang";
    metropolis.thumbnail_url = "./thumbnails/metropolis.png";
    metropolis.video_url = "./videos/metropolis.mp4";
    metropolis.author = "Fritz Lang";
    metropolis.tags = {"dramatic", "orchestral", "silent film"};
    metropolis.duration = "12000.000";
    return {metropolis};
}

const Video* VideoCatalog::find_by_id(std::string_view id) const {
    for (const Video& video : videos_) {
        if (video.id == id) {
            return &video;
        }
    }
    return nullptr;
}

std::string VideoCatalog::video_path(const Video& video) const {
    return resolve(video.video_url);
}

std::string VideoCatalog::thumbnail_path(const Video& video) const {
    return resolve(video.thumbnail_url);
}

std::string VideoCatalog::resolve(const std::string& relative_url) const {
    if (relative_url.empty()) {
        return std::string();
    }
    std::filesystem::path path(relative_url);
    if (path.is_absolute()) {
        return path.lexically_normal().string();
    }
    return (std::filesystem::path(media_root_) / path).lexically_normal().string();
}

Json::JsonValue VideoCatalog::to_json() const {
    Json::JsonValue list = Json::JsonValue::array();
    for (const Video& video : videos_) {
        list.push_back(video_to_json(video));
    }
    return list;
}

} // namespace Catalog
} // namespace Vidstream
