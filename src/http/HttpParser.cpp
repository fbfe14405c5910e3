// vidstream/src/http/HttpParser.cpp
#include "vidstream/http/HttpParser.h"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace Vidstream {
namespace Http {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

HttpParser::HttpParser() : state_(ParsingState::REQUEST_LINE), body_expected_length_(0) {}

void HttpParser::reset() {
    state_ = ParsingState::REQUEST_LINE;
    body_expected_length_ = 0;
    error_message_.clear();
}

void HttpParser::fail(std::string message) {
    state_ = ParsingState::ERROR;
    error_message_ = std::move(message);
}

bool HttpParser::parse_request(std::string_view raw_buffer, size_t& bytes_processed, HttpRequest& request) {
    bytes_processed = 0;
    std::string_view current_data = raw_buffer;

    while (state_ != ParsingState::COMPLETE && state_ != ParsingState::ERROR) {
        bool step_complete = false;

        switch (state_) {
            case ParsingState::REQUEST_LINE:
                step_complete = parse_request_line(current_data, request);
                break;
            case ParsingState::HEADERS:
                step_complete = parse_headers(current_data, request);
                break;
            case ParsingState::BODY:
                step_complete = parse_body(current_data, request);
                break;
            default:
                fail("Invalid parser state.");
                return false;
        }

        if (state_ == ParsingState::ERROR) {
            return false;
        }

        bytes_processed = raw_buffer.length() - current_data.length();

        if (!step_complete) {
            // Need more data
            return false;
        }
    }

    return state_ == ParsingState::COMPLETE;
}

bool HttpParser::parse_request_line(std::string_view& data, HttpRequest& request) {
    size_t eol_pos = data.find("\r\n");
    if (eol_pos == std::string_view::npos) {
        return false;
    }

    std::string_view line = data.substr(0, eol_pos);
    data.remove_prefix(eol_pos + 2); // Consume line and CRLF

    size_t first_space = line.find(' ');
    size_t second_space = first_space == std::string_view::npos ? std::string_view::npos
                                                                  : line.find(' ', first_space + 1);

    if (first_space == std::string_view::npos || second_space == std::string_view::npos) {
        fail("Invalid request line format: " + std::string(line));
        return false;
    }

    std::string_view method_str = line.substr(0, first_space);
    std::string_view path_and_query_str = line.substr(first_space + 1, second_space - (first_space + 1));
    std::string_view version = line.substr(second_space + 1);

    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        fail("Unsupported HTTP version: " + std::string(version));
        return false;
    }
    request.version_ = std::string(version);

    if (method_str == "GET") request.method_ = HttpMethod::GET;
    else if (method_str == "POST") request.method_ = HttpMethod::POST;
    else if (method_str == "PUT") request.method_ = HttpMethod::PUT;
    else if (method_str == "DELETE") request.method_ = HttpMethod::DELETE;
    else if (method_str == "PATCH") request.method_ = HttpMethod::PATCH;
    else if (method_str == "HEAD") request.method_ = HttpMethod::HEAD;
    else if (method_str == "OPTIONS") request.method_ = HttpMethod::OPTIONS;
    else {
        request.method_ = HttpMethod::UNKNOWN;
        fail("Unsupported HTTP method: " + std::string(method_str));
        return false;
    }

    if (path_and_query_str.empty() || path_and_query_str.front() != '/') {
        fail("Invalid request target: " + std::string(path_and_query_str));
        return false;
    }

    parse_query_parameters(path_and_query_str, request);

    state_ = ParsingState::HEADERS;
    return true;
}

void HttpParser::parse_query_parameters(std::string_view path_and_query, HttpRequest& request) {
    size_t query_start = path_and_query.find('?');
    if (query_start == std::string_view::npos) {
        request.path_ = std::string(path_and_query);
        return;
    }

    request.path_ = std::string(path_and_query.substr(0, query_start));
    std::string_view query_str = path_and_query.substr(query_start + 1);

    size_t start = 0;
    while (start < query_str.length()) {
        size_t amp_pos = query_str.find('&', start);
        std::string_view pair = query_str.substr(start, amp_pos == std::string_view::npos
                                                            ? std::string_view::npos
                                                            : amp_pos - start);
        size_t eq_pos = pair.find('=');
        if (eq_pos == std::string_view::npos) {
            request.query_params_[std::string(pair)] = "";
        } else {
            request.query_params_[std::string(pair.substr(0, eq_pos))] = std::string(pair.substr(eq_pos + 1));
        }

        if (amp_pos == std::string_view::npos) {
            break;
        }
        start = amp_pos + 1;
    }
}

bool HttpParser::parse_headers(std::string_view& data, HttpRequest& request) {
    while (true) {
        size_t eol_pos = data.find("\r\n");
        if (eol_pos == std::string_view::npos) {
            return false;
        }

        std::string_view line = data.substr(0, eol_pos);
        data.remove_prefix(eol_pos + 2);

        if (line.empty()) {
            // End of headers
            auto content_length_header = request.header("Content-Length");
            if (content_length_header) {
                std::string_view value = trim(*content_length_header);
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), body_expected_length_);
                if (ec != std::errc() || ptr != value.data() + value.size()) {
                    fail("Invalid Content-Length header: " + std::string(value));
                    return false;
                }
            } else if (request.header("Transfer-Encoding")) {
                fail("Transfer-Encoding is not supported.");
                return false;
            }

            state_ = body_expected_length_ > 0 ? ParsingState::BODY : ParsingState::COMPLETE;
            return true;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string_view::npos || colon_pos == 0) {
            fail("Invalid header format: " + std::string(line));
            return false;
        }

        std::string key(line.substr(0, colon_pos));
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        request.headers_[key] = std::string(trim(line.substr(colon_pos + 1)));
    }
}

bool HttpParser::parse_body(std::string_view& data, HttpRequest& request) {
    if (data.length() < body_expected_length_) {
        return false;
    }
    request.body_ = std::string(data.substr(0, body_expected_length_));
    data.remove_prefix(body_expected_length_);
    state_ = ParsingState::COMPLETE;
    return true;
}

} // namespace Http
} // namespace Vidstream
