// vidstream/tests/test_helpers.h
#ifndef VIDSTREAM_TESTS_TEST_HELPERS_H
#define VIDSTREAM_TESTS_TEST_HELPERS_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace test_helpers {

// Scratch directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("vidstream_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Writes `content` to `relative` (creating parent directories) and returns the full path
    std::string write(const std::string& relative, const std::string& content) const {
        std::filesystem::path full = path_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return full.string();
    }

private:
    std::filesystem::path path_;
};

// Deterministic non-repeating-ish payload; byte i is a function of i
inline std::string pattern_bytes(size_t size) {
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 251) & 0xFF);
    }
    return data;
}

} // namespace test_helpers

#endif // VIDSTREAM_TESTS_TEST_HELPERS_H
