// vidstream/src/media/FileMetadata.cpp
#include "vidstream/media/FileMetadata.h"
#include <sys/stat.h>
#include <errno.h>
#include <cstring>

namespace Vidstream {
namespace Media {

FileInfo FileMetadata::resolve(const std::string& path) {
    FileInfo info;

    if (path.empty()) {
        info.status = FileStatus::NOT_FOUND;
        return info;
    }

    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            info.status = FileStatus::NOT_FOUND;
        } else {
            info.status = FileStatus::IO_ERROR;
            info.error = strerror(errno);
        }
        return info;
    }

    if (!S_ISREG(st.st_mode)) {
        info.status = FileStatus::NOT_FOUND;
        return info;
    }

    info.status = FileStatus::OK;
    info.size = static_cast<uint64_t>(st.st_size);
    return info;
}

} // namespace Media
} // namespace Vidstream
