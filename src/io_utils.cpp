#include "fsplit/io_utils.hpp"
#include "errors.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace fsplit {
namespace util {

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        // Errors on this path are reported by an explicit close()
        ::close(fd_);
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

FileHandle FileHandle::create(const std::string& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        throw make_io_error("cannot create output file", path);
    }
    return FileHandle(fd, path);
}

void FileHandle::resize(uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        throw make_io_error("cannot pre-size output file to " + std::to_string(size) + " bytes", path_);
    }
}

void FileHandle::write_at(const char* data, size_t len, uint64_t offset) {
    while (len > 0) {
        ssize_t written = ::pwrite(fd_, data, len, static_cast<off_t>(offset));
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw make_io_error("write failed at offset " + std::to_string(offset), path_);
        }
        if (written == 0) {
            errno = 0;
            throw make_io_error("no progress writing at offset " + std::to_string(offset), path_);
        }
        data += written;
        len -= static_cast<size_t>(written);
        offset += static_cast<uint64_t>(written);
    }
}

void FileHandle::close() {
    if (fd_ < 0) {
        return;
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) == -1) {
        throw make_io_error("failed to close output file", path_);
    }
}

} // namespace util
} // namespace fsplit
