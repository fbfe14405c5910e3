// vidstream/src/server/PathMatcher.cpp
#include "vidstream/server/PathMatcher.h"

namespace Vidstream {
namespace Server {

std::optional<PathParams> PathMatcher::match(std::string_view path_template, std::string_view path) {
    std::vector<std::string_view> template_segments = split_path_to_segments(path_template);
    std::vector<std::string_view> path_segments = split_path_to_segments(path);

    if (template_segments.size() != path_segments.size()) {
        return std::nullopt;
    }

    PathParams params;
    for (size_t i = 0; i < template_segments.size(); ++i) {
        std::string_view pattern = template_segments[i];
        std::string_view segment = path_segments[i];

        if (pattern.front() == ':') {
            params[std::string(pattern.substr(1))] = std::string(segment);
        } else if (pattern != segment) {
            return std::nullopt;
        }
    }
    return params;
}

std::vector<std::string_view> PathMatcher::split_path_to_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    size_t end = path.find('/');

    while (end != std::string_view::npos) {
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
        end = path.find('/', start);
    }
    if (start < path.length()) { // Add the last segment if any
        segments.push_back(path.substr(start));
    }
    return segments;
}

} // namespace Server
} // namespace Vidstream
