// vidstream/include/vidstream/media/RangeResolver.h
#ifndef VIDSTREAM_MEDIA_RANGERESOLVER_H
#define VIDSTREAM_MEDIA_RANGERESOLVER_H

#include "vidstream/http/HttpEnums.h"
#include "vidstream/media/RangeParser.h"
#include <cstdint>
#include <optional>
#include <string>

namespace Vidstream {
namespace Media {

// Everything needed to answer one request for a file of `total_size` bytes.
// Built once per request and never modified.
struct StreamPlan {
    Http::HttpStatus status = Http::HttpStatus::OK;
    std::optional<ByteRange> content_range; // Set for 206 only
    uint64_t total_size = 0;
    uint64_t content_length = 0;
    uint64_t start = 0;
    uint64_t end = 0; // Inclusive; meaningless when content_length is 0

    bool satisfiable() const { return status != Http::HttpStatus::RANGE_NOT_SATISFIABLE; }
    bool has_body() const { return satisfiable() && content_length > 0; }

    // "bytes 500-999/1000" for 206, "bytes */1000" for 416, empty otherwise
    std::string content_range_header() const;
};

// Clamps an explicit end to the last byte of the file, rejects ranges that
// start at or past the end of the file (416), and serves a malformed or
// missing range as the whole file (200).
StreamPlan resolve_range(const RangeRequest& request, uint64_t file_size);

} // namespace Media
} // namespace Vidstream

#endif // VIDSTREAM_MEDIA_RANGERESOLVER_H
