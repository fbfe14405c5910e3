// vidstream/include/vidstream/net/Connection.h
#ifndef VIDSTREAM_NET_CONNECTION_H
#define VIDSTREAM_NET_CONNECTION_H

#include "vidstream/http/HttpRequest.h"
#include "vidstream/http/HttpResponse.h"
#include "vidstream/http/HttpParser.h"
#include "vidstream/media/RangeStream.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace Vidstream {
namespace Net {

enum class IoStatus {
    OK,          // Made progress
    WOULD_BLOCK, // Nothing could be transferred right now
    CLOSED,      // Peer closed the connection
    ERROR
};

class Connection {
public:
    static constexpr size_t READ_BUFFER_SIZE = 16384; // Largest request head we accept

    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Drains the socket into the read buffer until it would block.
    IoStatus read_data();

    // Tries to parse one request out of the read buffer. Returns true when a
    // complete request is ready in take_request(). Check parse_failed() when
    // it returns false.
    bool process_read_buffer();
    bool parse_failed() const { return request_too_large_ || http_parser_.get_state() == Http::ParsingState::ERROR; }
    Http::HttpRequest take_request();

    // Queues a response: headers first, then either the in-memory body or
    // the file stream.
    void set_response_content(Http::HttpResponse&& response);

    // Sends pending headers and in-memory body, or at most one chunk of a
    // streamed body.
    IoStatus write_data();
    bool has_data_to_write() const;

    // Clears response state for the next request on a keep-alive connection.
    // Unparsed bytes already read (pipelined requests) are kept.
    void reset();

    void close_connection();

    void update_activity() { last_activity_ = std::chrono::steady_clock::now(); }
    std::chrono::steady_clock::time_point get_last_activity() const { return last_activity_; }

    bool is_open() const { return socket_fd_ >= 0; }
    int fd() const { return socket_fd_; }

    bool keep_alive() const { return keep_alive_; }
    void set_keep_alive(bool keep_alive) { keep_alive_ = keep_alive; }

    // Set from dispatch until the event loop picks up the finished response
    std::atomic<bool> in_flight_{false};

private:
    IoStatus send_buffered(const std::string& data, size_t& offset);

    int socket_fd_;
    std::vector<char> read_buffer_;
    size_t read_buffer_fill_ = 0;

    Http::HttpParser http_parser_;
    Http::HttpRequest current_request_;
    bool request_too_large_ = false;

    std::string head_to_send_;
    size_t head_sent_ = 0;
    std::string body_to_send_;
    size_t body_sent_ = 0;
    std::unique_ptr<Media::RangeStream> stream_;

    std::chrono::steady_clock::time_point last_activity_;
    bool keep_alive_ = true;
};

} // namespace Net
} // namespace Vidstream

#endif // VIDSTREAM_NET_CONNECTION_H
