// vidstream/include/vidstream/http/HttpRequest.h
#ifndef VIDSTREAM_HTTP_HTTPREQUEST_H
#define VIDSTREAM_HTTP_HTTPREQUEST_H

#include "vidstream/http/HttpEnums.h"
#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>

namespace Vidstream {
namespace Http {

class HttpParser;

class HttpRequest {
public:
    HttpMethod method_ = HttpMethod::UNKNOWN;
    std::string path_;
    std::string version_; // E.g., "HTTP/1.1"

    // Header names are stored lower-cased so lookups are case-insensitive.
    // The request owns its data: it outlives the connection's read buffer
    // once it is handed to a worker thread.
    std::unordered_map<std::string, std::string> headers_;

    // Query parameters (e.g., ?key=value)
    std::unordered_map<std::string, std::string> query_params_;

    // Path parameters (e.g., /api/videos/:id) - set by the Router
    std::unordered_map<std::string, std::string> path_params_;

    std::string body_;

    HttpRequest() = default;

    HttpMethod method() const { return method_; }
    const std::string& path() const { return path_; }
    const std::string& version() const { return version_; }

    // Case-insensitive header lookup
    std::optional<std::string_view> header(std::string_view name) const;

    std::optional<std::string_view> query(std::string_view name) const;

    std::optional<std::string_view> param(std::string_view name) const;

    const std::string& body() const { return body_; }

    // HTTP/1.1 defaults to persistent connections, HTTP/1.0 to close.
    bool keep_alive() const;

    // For debugging/logging
    std::string to_string() const;
};

} // namespace Http
} // namespace Vidstream

#endif // VIDSTREAM_HTTP_HTTPREQUEST_H
