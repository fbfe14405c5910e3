// vidstream/include/vidstream/media/RangeParser.h
#ifndef VIDSTREAM_MEDIA_RANGEPARSER_H
#define VIDSTREAM_MEDIA_RANGEPARSER_H

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace Vidstream {
namespace Media {

// Inclusive byte window, 0 <= start <= end < file size
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end - start + 1; }
};

// No Range header, or an empty one
struct RangeAbsent {};

// A Range header we could not read; served as if it were absent
struct RangeMalformed {};

// A single range as the client wrote it, not yet checked against the file.
//   bytes=500-999  -> start 500, end 999
//   bytes=500-     -> start 500, no end
//   bytes=-500     -> no start, end 500 (suffix: the last 500 bytes)
struct RangeSpec {
    std::optional<uint64_t> start;
    std::optional<uint64_t> end;

    bool is_suffix() const { return !start.has_value(); }
};

using RangeRequest = std::variant<RangeAbsent, RangeMalformed, RangeSpec>;

// Parses the value of a Range request header. Only the single-range
// "bytes=" form is accepted; range lists are reported as malformed.
RangeRequest parse_range_header(std::optional<std::string_view> header_value);

} // namespace Media
} // namespace Vidstream

#endif // VIDSTREAM_MEDIA_RANGEPARSER_H
