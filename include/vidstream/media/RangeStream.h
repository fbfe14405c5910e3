// vidstream/include/vidstream/media/RangeStream.h
#ifndef VIDSTREAM_MEDIA_RANGESTREAM_H
#define VIDSTREAM_MEDIA_RANGESTREAM_H

#include "vidstream/media/FileHandle.h"
#include "vidstream/media/RangeResolver.h"
#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>

namespace Vidstream {
namespace Media {

// Response body for one file window. Owns the open file and a single chunk
// buffer, so memory stays at chunk_size however large the window is.
class RangeStream {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

    // `plan` must have a body (plan.has_body()).
    RangeStream(FileHandle file, const StreamPlan& plan, std::string path,
                size_t chunk_size = DEFAULT_CHUNK_SIZE);

    RangeStream(const RangeStream&) = delete;
    RangeStream& operator=(const RangeStream&) = delete;

    // Sends what is pending, reading at most one chunk from the file first if
    // nothing is. Returns bytes written to the socket (0 if it would block),
    // or -1 when the stream cannot continue: read failure, file shorter than
    // planned, or a socket error.
    ssize_t pump(int socket_fd);

    // True once every planned byte has been handed to the socket.
    bool finished() const { return remaining_ == 0 && pending_begin_ == pending_end_; }

    uint64_t bytes_sent() const { return bytes_sent_; }
    uint64_t content_length() const { return content_length_; }
    const std::string& path() const { return path_; }

private:
    bool fill_buffer();

    FileHandle file_;
    std::string path_;
    std::vector<char> buffer_;
    size_t pending_begin_ = 0;
    size_t pending_end_ = 0;
    uint64_t next_offset_;
    uint64_t remaining_;       // Bytes not yet read from the file
    uint64_t content_length_;
    uint64_t bytes_sent_ = 0;
};

} // namespace Media
} // namespace Vidstream

#endif // VIDSTREAM_MEDIA_RANGESTREAM_H
