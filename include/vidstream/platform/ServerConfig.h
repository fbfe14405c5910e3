// vidstream/include/vidstream/platform/ServerConfig.h
#ifndef VIDSTREAM_PLATFORM_SERVER_CONFIG_H
#define VIDSTREAM_PLATFORM_SERVER_CONFIG_H

#include "vidstream/catalog/VideoCatalog.h"
#include "vidstream/media/RangeStream.h"
#include "vidstream/json/JsonValue.h"
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Vidstream {
namespace Platform {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    size_t thread_pool_size = std::thread::hardware_concurrency() * 2;
    std::string media_root = ".";
    size_t stream_chunk_size = Media::RangeStream::DEFAULT_CHUNK_SIZE;
    int idle_timeout_seconds = 60;

    // Replaces the built-in catalog when the config file has a "videos" array
    std::optional<std::vector<Catalog::Video>> videos;

    // Reads a JSON config file on top of the defaults. Keys that are absent
    // keep their default value. Throws std::runtime_error if the file cannot
    // be read, is not a JSON object, or holds a value of the wrong type.
    static ServerConfig load_file(const std::string& path);

    // Same, from an already parsed document
    static ServerConfig from_json(const Json::JsonValue& doc);

    // PORT overrides the configured port
    void apply_environment();

    // Throws std::runtime_error describing the first invalid setting
    void validate() const;
};

} // namespace Platform
} // namespace Vidstream

#endif // VIDSTREAM_PLATFORM_SERVER_CONFIG_H
