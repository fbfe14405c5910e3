// vidstream/include/vidstream/media/FileMetadata.h
#ifndef VIDSTREAM_MEDIA_FILEMETADATA_H
#define VIDSTREAM_MEDIA_FILEMETADATA_H

#include <cstdint>
#include <string>

namespace Vidstream {
namespace Media {

enum class FileStatus {
    OK,
    NOT_FOUND, // Missing, or not a regular file
    IO_ERROR   // stat() failed for any other reason
};

struct FileInfo {
    FileStatus status = FileStatus::NOT_FOUND;
    uint64_t size = 0;
    std::string error; // errno text for IO_ERROR

    bool ok() const { return status == FileStatus::OK; }
};

class FileMetadata {
public:
    // Metadata read only; the file is never opened.
    static FileInfo resolve(const std::string& path);
};

inline const char* file_status_to_string(FileStatus status) {
    switch (status) {
        case FileStatus::OK: return "OK";
        case FileStatus::NOT_FOUND: return "NOT_FOUND";
        case FileStatus::IO_ERROR: return "IO_ERROR";
    }
    return "IO_ERROR";
}

} // namespace Media
} // namespace Vidstream

#endif // VIDSTREAM_MEDIA_FILEMETADATA_H
