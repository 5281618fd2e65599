#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace waly {

// Owns one POSIX file descriptor. All failures throw WalError(Io).
class File {
public:
    File() = default;
    ~File();

    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    // Creates the file if absent; writes always go to the end.
    static File openReadAppend(const std::string& path);
    // Creates or truncates; used for compaction output.
    static File createTruncate(const std::string& path);

    bool isOpen() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    std::string readAll() const;
    void append(std::string_view bytes);
    void truncate(uint64_t length);
    void sync();
    uint64_t size() const;
    void close();

private:
    File(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::string path_;
};

void syncDirectory(const std::string& dir);

// rename(2): atomically replaces `to` with `from`.
void replaceFile(const std::string& from, const std::string& to);

} // namespace waly
