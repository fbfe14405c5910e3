// vidstream/include/vidstream/media/FileHandle.h
#ifndef VIDSTREAM_MEDIA_FILEHANDLE_H
#define VIDSTREAM_MEDIA_FILEHANDLE_H

#include <cstdint>
#include <string>
#include <sys/types.h> // For ssize_t

namespace Vidstream {
namespace Media {

// Read-only file descriptor owned by exactly one response body.
// Closed on destruction, whatever path the stream took to get there.
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    // Opens `path` for reading. Returns an invalid handle on failure;
    // `error_out` receives the errno text.
    static FileHandle open_read_only(const std::string& path, std::string& error_out);

    // Positional read; does not move a shared file offset.
    // Returns bytes read, 0 at EOF, -1 on error (errno set).
    ssize_t read_at(char* buffer, size_t length, uint64_t offset) const;

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    void close();

private:
    int fd_ = -1;
};

} // namespace Media
} // namespace Vidstream

#endif // VIDSTREAM_MEDIA_FILEHANDLE_H
