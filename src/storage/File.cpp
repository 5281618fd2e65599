#include "waly/File.hpp"
#include "waly/WalError.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace waly {

namespace {

[[noreturn]] void throwIo(const char* op, const std::string& path) {
    int err = errno;
    throw WalError(WalError::Kind::Io,
                   std::string(op) + " failed for " + path + ": " + std::strerror(err));
}

} // namespace

File::~File() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

File::File(File&& other) noexcept : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

File File::openReadAppend(const std::string& path) {
    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) throwIo("open()", path);
    return File(fd, path);
}

File File::createTruncate(const std::string& path) {
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) throwIo("open()", path);
    return File(fd, path);
}

std::string File::readAll() const {
    std::string out;
    char buffer[64 * 1024];
    off_t offset = 0;
    while (true) {
        ssize_t n = ::pread(fd_, buffer, sizeof(buffer), offset);
        if (n == -1) {
            if (errno == EINTR) continue;
            throwIo("pread()", path_);
        }
        if (n == 0) break;
        out.append(buffer, static_cast<size_t>(n));
        offset += n;
    }
    return out;
}

void File::append(std::string_view bytes) {
    const char* p = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n == -1) {
            if (errno == EINTR) continue;
            throwIo("write()", path_);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void File::truncate(uint64_t length) {
    if (::ftruncate(fd_, static_cast<off_t>(length)) == -1)
        throwIo("ftruncate()", path_);
}

void File::sync() {
    if (::fsync(fd_) == -1)
        throwIo("fsync()", path_);
}

uint64_t File::size() const {
    struct stat st;
    if (::fstat(fd_, &st) == -1)
        throwIo("fstat()", path_);
    return static_cast<uint64_t>(st.st_size);
}

void File::close() {
    if (fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) == -1)
        throwIo("close()", path_);
}

void syncDirectory(const std::string& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd == -1) throwIo("open()", dir);
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc == -1) {
        errno = err;
        throwIo("fsync()", dir);
    }
}

void replaceFile(const std::string& from, const std::string& to) {
    if (std::rename(from.c_str(), to.c_str()) != 0)
        throwIo("rename()", from + " -> " + to);
}

} // namespace waly
