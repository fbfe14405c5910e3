// vidstream/src/media/FileHandle.cpp
#include "vidstream/media/FileHandle.h"
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <utility>

namespace Vidstream {
namespace Media {

FileHandle::~FileHandle() {
    close();
}

FileHandle::FileHandle(FileHandle&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

FileHandle FileHandle::open_read_only(const std::string& path, std::string& error_out) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        error_out = strerror(errno);
        return FileHandle();
    }
    return FileHandle(fd);
}

ssize_t FileHandle::read_at(char* buffer, size_t length, uint64_t offset) const {
    ssize_t n;
    do {
        n = ::pread(fd_, buffer, length, static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);
    return n;
}

void FileHandle::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace Media
} // namespace Vidstream
