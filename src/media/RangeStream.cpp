// vidstream/src/media/RangeStream.cpp
#include "vidstream/media/RangeStream.h"
#include <sys/socket.h>
#include <errno.h>
#include <cstring>
#include <algorithm>
#include <iostream>

namespace Vidstream {
namespace Media {

RangeStream::RangeStream(FileHandle file, const StreamPlan& plan, std::string path, size_t chunk_size)
    : file_(std::move(file)),
      path_(std::move(path)),
      buffer_(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE),
      next_offset_(plan.start),
      remaining_(plan.has_body() ? plan.content_length : 0),
      content_length_(remaining_) {}

bool RangeStream::fill_buffer() {
    size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), remaining_));
    ssize_t n = file_.read_at(buffer_.data(), to_read, next_offset_);
    if (n < 0) {
        std::cerr << "Read failure on " << path_ << " at offset " << next_offset_
                  << ": " << strerror(errno) << std::endl;
        return false;
    }
    if (n == 0) {
        // Truncated after the headers went out; Content-Length can no longer be honoured.
        std::cerr << "Unexpected end of file on " << path_ << " at offset " << next_offset_
                  << " with " << remaining_ << " bytes outstanding" << std::endl;
        return false;
    }

    pending_begin_ = 0;
    pending_end_ = static_cast<size_t>(n);
    next_offset_ += static_cast<uint64_t>(n);
    remaining_ -= static_cast<uint64_t>(n);
    return true;
}

ssize_t RangeStream::pump(int socket_fd) {
    if (finished()) {
        return 0;
    }

    if (pending_begin_ == pending_end_ && !fill_buffer()) {
        file_.close();
        return -1;
    }

    ssize_t sent = send(socket_fd, buffer_.data() + pending_begin_, pending_end_ - pending_begin_, MSG_NOSIGNAL);
    if (sent < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return 0; // Unsent bytes stay in the buffer for the next pump
        }
        std::cerr << "Error streaming " << path_ << " to socket " << socket_fd
                  << ": " << strerror(errno) << std::endl;
        file_.close();
        return -1;
    }

    pending_begin_ += static_cast<size_t>(sent);
    bytes_sent_ += static_cast<uint64_t>(sent);

    if (finished()) {
        file_.close();
    }
    return sent;
}

} // namespace Media
} // namespace Vidstream
