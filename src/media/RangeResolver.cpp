// vidstream/src/media/RangeResolver.cpp
#include "vidstream/media/RangeResolver.h"
#include <algorithm>

namespace Vidstream {
namespace Media {

namespace {

StreamPlan full_file_plan(uint64_t file_size) {
    StreamPlan plan;
    plan.status = Http::HttpStatus::OK;
    plan.total_size = file_size;
    plan.content_length = file_size;
    plan.start = 0;
    plan.end = file_size > 0 ? file_size - 1 : 0;
    return plan;
}

StreamPlan unsatisfiable_plan(uint64_t file_size) {
    StreamPlan plan;
    plan.status = Http::HttpStatus::RANGE_NOT_SATISFIABLE;
    plan.total_size = file_size;
    plan.content_length = 0;
    return plan;
}

StreamPlan partial_plan(uint64_t start, uint64_t end, uint64_t file_size) {
    StreamPlan plan;
    plan.status = Http::HttpStatus::PARTIAL_CONTENT;
    plan.total_size = file_size;
    plan.start = start;
    plan.end = end;
    plan.content_length = end - start + 1;
    plan.content_range = ByteRange{start, end};
    return plan;
}

} // namespace

std::string StreamPlan::content_range_header() const {
    if (status == Http::HttpStatus::RANGE_NOT_SATISFIABLE) {
        return "bytes */" + std::to_string(total_size);
    }
    if (!content_range) {
        return std::string();
    }
    return "bytes " + std::to_string(content_range->start) + "-" +
           std::to_string(content_range->end) + "/" + std::to_string(total_size);
}

StreamPlan resolve_range(const RangeRequest& request, uint64_t file_size) {
    const RangeSpec* spec = std::get_if<RangeSpec>(&request);
    if (!spec) {
        // Absent and malformed headers both get the whole file
        return full_file_plan(file_size);
    }

    if (file_size == 0) {
        return unsatisfiable_plan(file_size);
    }
    const uint64_t last_byte = file_size - 1;

    if (spec->is_suffix()) {
        uint64_t suffix = spec->end.value_or(0);
        if (suffix == 0) {
            return unsatisfiable_plan(file_size);
        }
        uint64_t length = std::min(suffix, file_size);
        return partial_plan(file_size - length, last_byte, file_size);
    }

    uint64_t start = *spec->start;
    if (start >= file_size) {
        return unsatisfiable_plan(file_size);
    }
    uint64_t end = std::min(spec->end.value_or(last_byte), last_byte);
    return partial_plan(start, end, file_size);
}

} // namespace Media
} // namespace Vidstream
