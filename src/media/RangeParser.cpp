// vidstream/src/media/RangeParser.cpp
#include "vidstream/media/RangeParser.h"
#include <cctype>
#include <charconv>

namespace Vidstream {
namespace Media {

namespace {

void skip_ws(std::string_view& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
}

// Reads a decimal number from the front of `s`. Fails on an empty field,
// a sign, or a value that does not fit in 64 bits.
bool parse_number(std::string_view& s, uint64_t& out) {
    skip_ws(s);
    if (s.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc() || ptr == s.data()) {
        return false;
    }
    s.remove_prefix(static_cast<size_t>(ptr - s.data()));
    skip_ws(s);
    return true;
}

bool starts_with_bytes_unit(std::string_view s) {
    static constexpr std::string_view unit = "bytes";
    if (s.size() < unit.size()) {
        return false;
    }
    for (size_t i = 0; i < unit.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != unit[i]) {
            return false;
        }
    }
    return true;
}

} // namespace

RangeRequest parse_range_header(std::optional<std::string_view> header_value) {
    if (!header_value) {
        return RangeAbsent{};
    }

    std::string_view s = *header_value;
    skip_ws(s);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    if (s.empty()) {
        return RangeAbsent{};
    }

    if (!starts_with_bytes_unit(s)) {
        return RangeMalformed{};
    }
    s.remove_prefix(5);
    skip_ws(s);
    if (s.empty() || s.front() != '=') {
        return RangeMalformed{};
    }
    s.remove_prefix(1);
    skip_ws(s);

    RangeSpec spec;

    // Suffix form. Earlier releases read "bytes=-500" as an unparseable start
    // and fell back to offset 0; it now means the final 500 bytes.
    if (!s.empty() && s.front() == '-') {
        s.remove_prefix(1);
        uint64_t suffix = 0;
        if (!parse_number(s, suffix) || !s.empty()) {
            return RangeMalformed{};
        }
        spec.end = suffix;
        return spec;
    }

    uint64_t start = 0;
    if (!parse_number(s, start)) {
        return RangeMalformed{};
    }
    if (s.empty() || s.front() != '-') {
        return RangeMalformed{};
    }
    s.remove_prefix(1);
    spec.start = start;

    skip_ws(s);
    if (s.empty()) {
        return spec; // "bytes=500-": to the end of the file
    }

    uint64_t end = 0;
    if (!parse_number(s, end) || !s.empty()) {
        // Includes range lists ("0-1,5-6"), which are not supported
        return RangeMalformed{};
    }
    if (end < start) {
        return RangeMalformed{};
    }
    spec.end = end;
    return spec;
}

} // namespace Media
} // namespace Vidstream
