// vidstream/src/net/Connection.cpp
#include "vidstream/net/Connection.h"
#include <unistd.h>     // For close
#include <sys/socket.h> // For recv, send
#include <errno.h>
#include <cstring>
#include <iostream>

namespace Vidstream {
namespace Net {

Connection::Connection(int fd)
    : socket_fd_(fd),
      read_buffer_(READ_BUFFER_SIZE),
      last_activity_(std::chrono::steady_clock::now()) {}

Connection::~Connection() {
    close_connection();
}

void Connection::reset() {
    head_to_send_.clear();
    head_sent_ = 0;
    body_to_send_.clear();
    body_sent_ = 0;
    stream_.reset(); // Releases the file handle
    http_parser_.reset();
    current_request_ = Http::HttpRequest();
    keep_alive_ = true;
    update_activity();
}

IoStatus Connection::read_data() {
    if (socket_fd_ < 0) return IoStatus::CLOSED;

    bool got_data = false;
    while (read_buffer_fill_ < read_buffer_.size()) {
        ssize_t bytes_read = recv(socket_fd_, read_buffer_.data() + read_buffer_fill_,
                                  read_buffer_.size() - read_buffer_fill_, 0);
        if (bytes_read > 0) {
            read_buffer_fill_ += static_cast<size_t>(bytes_read);
            got_data = true;
            continue;
        }
        if (bytes_read == 0) {
            return IoStatus::CLOSED;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        std::cerr << "Error reading from socket " << socket_fd_ << ": " << strerror(errno) << std::endl;
        return IoStatus::ERROR;
    }

    if (got_data) {
        update_activity();
        return IoStatus::OK;
    }
    return IoStatus::WOULD_BLOCK;
}

bool Connection::process_read_buffer() {
    if (read_buffer_fill_ == 0) return false;

    size_t bytes_consumed = 0;
    std::string_view buffer_view(read_buffer_.data(), read_buffer_fill_);

    bool request_complete = http_parser_.parse_request(buffer_view, bytes_consumed, current_request_);

    if (http_parser_.get_state() == Http::ParsingState::ERROR) {
        std::cerr << "HTTP parsing error for fd " << socket_fd_ << ": " << http_parser_.get_error_message() << std::endl;
        return false;
    }

    if (bytes_consumed > 0) {
        // Shift remaining data to the beginning of the buffer
        std::memmove(read_buffer_.data(), read_buffer_.data() + bytes_consumed, read_buffer_fill_ - bytes_consumed);
        read_buffer_fill_ -= bytes_consumed;
    }

    if (!request_complete && read_buffer_fill_ == read_buffer_.size()) {
        std::cerr << "Request head too large on fd " << socket_fd_ << std::endl;
        request_too_large_ = true;
    }

    return request_complete;
}

Http::HttpRequest Connection::take_request() {
    Http::HttpRequest request = std::move(current_request_);
    current_request_ = Http::HttpRequest();
    http_parser_.reset();
    return request;
}

void Connection::set_response_content(Http::HttpResponse&& response) {
    update_activity();
    head_to_send_ = response.build_headers_string();
    head_sent_ = 0;
    body_sent_ = 0;
    if (response.is_stream()) {
        body_to_send_.clear();
        stream_ = response.take_stream();
    } else {
        body_to_send_ = response.take_body();
        stream_.reset();
    }
}

IoStatus Connection::send_buffered(const std::string& data, size_t& offset) {
    while (offset < data.size()) {
        ssize_t sent = send(socket_fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return IoStatus::WOULD_BLOCK;
            std::cerr << "Error writing to socket " << socket_fd_ << ": " << strerror(errno) << std::endl;
            return IoStatus::ERROR;
        }
        offset += static_cast<size_t>(sent);
    }
    return IoStatus::OK;
}

IoStatus Connection::write_data() {
    if (socket_fd_ < 0) return IoStatus::CLOSED;

    IoStatus status = send_buffered(head_to_send_, head_sent_);
    if (status != IoStatus::OK) {
        return status;
    }

    if (stream_) {
        ssize_t sent = stream_->pump(socket_fd_);
        if (sent < 0) {
            // Headers are out; the only way left to signal failure is to drop the connection
            std::cerr << "Aborting response on fd " << socket_fd_ << " after " << stream_->bytes_sent()
                      << " of " << stream_->content_length() << " body bytes" << std::endl;
            stream_.reset();
            return IoStatus::ERROR;
        }
        if (stream_->finished()) {
            stream_.reset();
        }
        update_activity();
        return sent > 0 || !stream_ ? IoStatus::OK : IoStatus::WOULD_BLOCK;
    }

    status = send_buffered(body_to_send_, body_sent_);
    if (status == IoStatus::OK) {
        update_activity();
    }
    return status;
}

bool Connection::has_data_to_write() const {
    return head_sent_ < head_to_send_.size() || body_sent_ < body_to_send_.size() || stream_ != nullptr;
}

void Connection::close_connection() {
    stream_.reset();
    if (socket_fd_ >= 0) {
        std::cout << "Closing connection " << socket_fd_ << std::endl;
        close(socket_fd_);
        socket_fd_ = -1;
    }
}

} // namespace Net
} // namespace Vidstream
