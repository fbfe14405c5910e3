// vidstream/include/vidstream/media/ByteStreamResponder.h
#ifndef VIDSTREAM_MEDIA_BYTESTREAMRESPONDER_H
#define VIDSTREAM_MEDIA_BYTESTREAMRESPONDER_H

#include "vidstream/http/HttpResponse.h"
#include "vidstream/media/RangeStream.h"
#include <optional>
#include <string>
#include <string_view>

namespace Vidstream {
namespace Media {

class ByteStreamResponder {
public:
    explicit ByteStreamResponder(size_t chunk_size = RangeStream::DEFAULT_CHUNK_SIZE)
        : chunk_size_(chunk_size) {}

    // Fills `res` for a GET of `path`, honouring an optional Range header.
    //   200 + whole file          no Range, or one we could not parse
    //   206 + Content-Range       satisfiable single range
    //   416 + bytes */size        range starting past the end of the file
    //   404                       missing file, stat or open failure
    // The file is opened here, before any header is committed, and handed to
    // the response as a RangeStream for the connection to pump.
    void respond(Http::HttpResponse& res,
                 std::optional<std::string_view> range_header,
                 const std::string& path,
                 const std::string& content_type) const;

    size_t chunk_size() const { return chunk_size_; }

private:
    size_t chunk_size_;
};

} // namespace Media
} // namespace Vidstream

#endif // VIDSTREAM_MEDIA_BYTESTREAMRESPONDER_H
