// vidstream/src/media/ByteStreamResponder.cpp
#include "vidstream/media/ByteStreamResponder.h"
#include "vidstream/media/FileMetadata.h"
#include "vidstream/media/RangeParser.h"
#include "vidstream/media/RangeResolver.h"
#include <iostream>
#include <memory>

namespace Vidstream {
namespace Media {

void ByteStreamResponder::respond(Http::HttpResponse& res,
                                  std::optional<std::string_view> range_header,
                                  const std::string& path,
                                  const std::string& content_type) const {
    FileInfo info = FileMetadata::resolve(path);
    if (!info.ok()) {
        if (info.status == FileStatus::IO_ERROR) {
            std::cerr << "Could not stat " << path << ": " << info.error << std::endl;
        } else {
            std::cerr << "File not found: " << path << std::endl;
        }
        res.not_found();
        return;
    }

    RangeRequest range = parse_range_header(range_header);
    if (std::holds_alternative<RangeMalformed>(range)) {
        std::cerr << "Ignoring malformed Range header '" << *range_header
                  << "' for " << path << std::endl;
    }

    const StreamPlan plan = resolve_range(range, info.size);

    if (!plan.satisfiable()) {
        res.status(Http::HttpStatus::RANGE_NOT_SATISFIABLE)
           .body(std::string())
           .header("Content-Range", plan.content_range_header())
           .header("Accept-Ranges", "bytes")
           .header("Access-Control-Allow-Origin", "*");
        return;
    }

    std::unique_ptr<RangeStream> body;
    if (plan.has_body()) {
        std::string open_error;
        FileHandle file = FileHandle::open_read_only(path, open_error);
        if (!file.is_open()) {
            std::cerr << "Could not open " << path << ": " << open_error << std::endl;
            res.not_found();
            return;
        }
        body = std::make_unique<RangeStream>(std::move(file), plan, path, chunk_size_);
    }

    res.status(plan.status)
       .header("Content-Type", content_type)
       .header("Accept-Ranges", "bytes")
       .header("Access-Control-Allow-Origin", "*");

    if (plan.content_range) {
        res.header("Content-Range", plan.content_range_header())
           .header("Connection", "keep-alive");
    }

    if (body) {
        res.stream(std::move(body));
    } else {
        res.body(std::string()); // Empty file
    }
}

} // namespace Media
} // namespace Vidstream
