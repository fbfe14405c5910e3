// vidstream/src/http/HttpRequest.cpp
#include "vidstream/http/HttpRequest.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Vidstream {
namespace Http {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    auto it = headers_.find(to_lower(name));
    if (it != headers_.end()) {
        return std::string_view(it->second);
    }
    return std::nullopt;
}

std::optional<std::string_view> HttpRequest::query(std::string_view name) const {
    auto it = query_params_.find(std::string(name));
    if (it != query_params_.end()) {
        return std::string_view(it->second);
    }
    return std::nullopt;
}

std::optional<std::string_view> HttpRequest::param(std::string_view name) const {
    auto it = path_params_.find(std::string(name));
    if (it != path_params_.end()) {
        return std::string_view(it->second);
    }
    return std::nullopt;
}

bool HttpRequest::keep_alive() const {
    auto connection = header("Connection");
    std::string value = connection ? to_lower(*connection) : std::string();

    if (version_ == "HTTP/1.0") {
        return value == "keep-alive";
    }
    return value != "close";
}

std::string HttpRequest::to_string() const {
    std::ostringstream oss;
    oss << "Method: " << http_method_to_string(method_) << "\n";
    oss << "Path: " << path_ << "\n";
    oss << "Version: " << version_ << "\n";
    oss << "Headers:\n";
    for (const auto& [key, value] : headers_) {
        oss << "  " << key << ": " << value << "\n";
    }
    if (!query_params_.empty()) {
        oss << "Query Params:\n";
        for (const auto& [key, value] : query_params_) {
            oss << "  " << key << ": " << value << "\n";
        }
    }
    if (!path_params_.empty()) {
        oss << "Path Params:\n";
        for (const auto& [key, value] : path_params_) {
            oss << "  " << key << ": " << value << "\n";
        }
    }
    oss << "Body Size: " << body_.length() << " bytes\n";
    return oss.str();
}

} // namespace Http
} // namespace Vidstream
