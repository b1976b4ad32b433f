#pragma once

#include <string>
#include <utility>
#include <cstdint>
#include <cstddef>

namespace fsplit {
namespace util {

// Owns a POSIX file descriptor. Shared by join workers for positioned writes.
class FileHandle {
public:
    FileHandle(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    // Creates or truncates `path` for writing
    static FileHandle create(const std::string& path);

    // Extends or shrinks the file to exactly `size` bytes
    void resize(uint64_t size);

    // Writes all `len` bytes at `offset`; safe to call from several threads on disjoint ranges
    void write_at(const char* data, size_t len, uint64_t offset);

    // Closes and reports deferred write errors
    void close();

private:
    int fd_ = -1;
    std::string path_;
};

} // namespace util
} // namespace fsplit
