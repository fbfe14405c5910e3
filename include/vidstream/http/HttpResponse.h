// vidstream/include/vidstream/http/HttpResponse.h
#ifndef VIDSTREAM_HTTP_HTTPRESPONSE_H
#define VIDSTREAM_HTTP_HTTPRESPONSE_H

#include "vidstream/http/HttpEnums.h"
#include "vidstream/media/RangeStream.h"
#include "vidstream/json/JsonValue.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace Vidstream {
namespace Http {

class HttpResponse {
private:
    HttpStatus status_ = HttpStatus::OK;
    std::unordered_map<std::string, std::string> headers_;
    // Either an in-memory body or a file window streamed by the connection
    std::variant<std::string, std::unique_ptr<Media::RangeStream>> body_content_;

public:
    HttpResponse();

    HttpResponse(const HttpResponse&) = delete;
    HttpResponse& operator=(const HttpResponse&) = delete;
    HttpResponse(HttpResponse&&) = default;
    HttpResponse& operator=(HttpResponse&&) = default;

    // Setters
    HttpResponse& status(HttpStatus status);
    HttpResponse& header(const std::string& name, const std::string& value);
    HttpResponse& remove_header(const std::string& name);

    HttpResponse& body(const std::string& content);
    HttpResponse& body(std::string&& content);

    // Streamed body. Content-Length comes from the stream's planned length.
    HttpResponse& stream(std::unique_ptr<Media::RangeStream> range_stream);

    // Convenience methods for common response types
    HttpResponse& json(const Json::JsonValue& json_val);
    HttpResponse& text(const std::string& content);

    // 404 with a plain-text body, readable from any origin
    HttpResponse& not_found();

    // Getters
    HttpStatus get_status() const { return status_; }
    const std::unordered_map<std::string, std::string>& get_headers() const { return headers_; }
    std::optional<std::string> get_header(const std::string& name) const;

    bool is_stream() const { return std::holds_alternative<std::unique_ptr<Media::RangeStream>>(body_content_); }
    const std::string& get_body() const; // Empty for streamed responses

    // Hands the in-memory body or the stream over to the connection
    std::string take_body();
    std::unique_ptr<Media::RangeStream> take_stream();

    // Status line and headers, terminated by the blank line
    std::string build_headers_string() const;

    void reset();
};

} // namespace Http
} // namespace Vidstream

#endif // VIDSTREAM_HTTP_HTTPRESPONSE_H
