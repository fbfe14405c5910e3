// vidstream/include/vidstream/http/HttpParser.h
#ifndef VIDSTREAM_HTTP_HTTPPARSER_H
#define VIDSTREAM_HTTP_HTTPPARSER_H

#include "vidstream/http/HttpRequest.h"
#include <string>
#include <string_view>

namespace Vidstream {
namespace Http {

// State for parsing HTTP requests incrementally
enum class ParsingState {
    REQUEST_LINE,
    HEADERS,
    BODY,
    COMPLETE,
    ERROR
};

class HttpParser {
public:
    HttpParser();
    ~HttpParser() = default;

    // Resets the parser state for a new request
    void reset();

    // Parses as much of raw_buffer as possible. Returns true once a full request
    // has been parsed into `request`. bytes_processed reports how many bytes of
    // raw_buffer were consumed and may be discarded by the caller.
    bool parse_request(std::string_view raw_buffer, size_t& bytes_processed, HttpRequest& request);

    ParsingState get_state() const { return state_; }
    const std::string& get_error_message() const { return error_message_; }

private:
    ParsingState state_;
    size_t body_expected_length_ = 0; // From Content-Length header

    bool parse_request_line(std::string_view& data, HttpRequest& request);
    bool parse_headers(std::string_view& data, HttpRequest& request);
    bool parse_body(std::string_view& data, HttpRequest& request);
    void parse_query_parameters(std::string_view path_and_query, HttpRequest& request);

    void fail(std::string message);

    std::string error_message_;
};

} // namespace Http
} // namespace Vidstream

#endif // VIDSTREAM_HTTP_HTTPPARSER_H
