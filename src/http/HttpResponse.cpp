// vidstream/src/http/HttpResponse.cpp
#include "vidstream/http/HttpResponse.h"
#include <sstream>
#include <ctime>   // For date header

namespace Vidstream {
namespace Http {

HttpResponse::HttpResponse() {
    reset();
}

HttpResponse& HttpResponse::status(HttpStatus status) {
    status_ = status;
    return *this;
}

HttpResponse& HttpResponse::header(const std::string& name, const std::string& value) {
    headers_[name] = value;
    return *this;
}

HttpResponse& HttpResponse::remove_header(const std::string& name) {
    headers_.erase(name);
    return *this;
}

HttpResponse& HttpResponse::body(const std::string& content) {
    body_content_ = content;
    header("Content-Length", std::to_string(content.length()));
    return *this;
}

HttpResponse& HttpResponse::body(std::string&& content) {
    header("Content-Length", std::to_string(content.length()));
    body_content_ = std::move(content);
    return *this;
}

HttpResponse& HttpResponse::stream(std::unique_ptr<Media::RangeStream> range_stream) {
    header("Content-Length", std::to_string(range_stream ? range_stream->content_length() : 0));
    body_content_ = std::move(range_stream);
    return *this;
}

HttpResponse& HttpResponse::json(const Json::JsonValue& json_val) {
    return body(json_val.to_string()).header("Content-Type", "application/json");
}

HttpResponse& HttpResponse::text(const std::string& content) {
    return body(content).header("Content-Type", "text/plain");
}

HttpResponse& HttpResponse::not_found() {
    remove_header("Content-Range");
    remove_header("Accept-Ranges");
    return status(HttpStatus::NOT_FOUND)
        .text("404 Not Found")
        .header("Access-Control-Allow-Origin", "*");
}

std::optional<std::string> HttpResponse::get_header(const std::string& name) const {
    auto it = headers_.find(name);
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& HttpResponse::get_body() const {
    static const std::string empty;
    if (const auto* text_body = std::get_if<std::string>(&body_content_)) {
        return *text_body;
    }
    return empty;
}

std::string HttpResponse::take_body() {
    if (auto* text_body = std::get_if<std::string>(&body_content_)) {
        return std::move(*text_body);
    }
    return std::string();
}

std::unique_ptr<Media::RangeStream> HttpResponse::take_stream() {
    if (auto* range_stream = std::get_if<std::unique_ptr<Media::RangeStream>>(&body_content_)) {
        return std::move(*range_stream);
    }
    return nullptr;
}

std::string HttpResponse::build_headers_string() const {
    std::ostringstream oss;

    // Status line
    oss << "HTTP/1.1 " << static_cast<int>(status_) << " " << http_status_to_string(status_) << "\r\n";

    // Date header (RFC 7231, Section 7.1.1.2)
    char buf[128];
    time_t now = time(nullptr);
    struct tm gmt;
    gmtime_r(&now, &gmt);
    strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
    oss << "Date: " << buf << "\r\n";

    for (const auto& pair : headers_) {
        oss << pair.first << ": " << pair.second << "\r\n";
    }

    oss << "\r\n"; // End of headers
    return oss.str();
}

void HttpResponse::reset() {
    status_ = HttpStatus::OK;
    headers_.clear();
    body_content_ = std::string();
    header("Server", "Vidstream/1.0.0");
    header("Connection", "keep-alive");
    header("Content-Length", "0");
}

} // namespace Http
} // namespace Vidstream
