// vidstream/include/vidstream/server/PathMatcher.h
#ifndef VIDSTREAM_SERVER_PATHMATCHER_H
#define VIDSTREAM_SERVER_PATHMATCHER_H

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Vidstream {
namespace Server {

using PathParams = std::unordered_map<std::string, std::string>;

class PathMatcher {
public:
    // Matches a request path against a template such as "/api/videos/:id".
    // Returns the captured parameters ({"id": "123"} for "/api/videos/123"),
    // an empty map for a literal match, or nullopt when they do not match.
    static std::optional<PathParams> match(std::string_view path_template, std::string_view path);

    // "/api/videos/:id" -> ["api", "videos", ":id"]; empty segments are dropped
    static std::vector<std::string_view> split_path_to_segments(std::string_view path);
};

} // namespace Server
} // namespace Vidstream

#endif // VIDSTREAM_SERVER_PATHMATCHER_H
