#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace fsplit {

enum class ErrorKind {
    Usage,
    Io,
    Parse,
    Corruption,
    Integrity
};

// Base for every error surfaced by split/join
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class UsageError : public Error {
public:
    explicit UsageError(const std::string& message) : Error(ErrorKind::Usage, message) {}
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message) : Error(ErrorKind::Io, message) {}
};

class ParseError : public Error {
public:
    explicit ParseError(const std::string& message) : Error(ErrorKind::Parse, message) {}
};

// part_index is 1-based; 0 means the problem is not tied to one part
class CorruptionError : public Error {
public:
    CorruptionError(const std::string& message, uint64_t part_index = 0)
        : Error(ErrorKind::Corruption, message), part_index_(part_index) {}

    uint64_t part_index() const { return part_index_; }

private:
    uint64_t part_index_;
};

class IntegrityError : public Error {
public:
    IntegrityError(const std::string& expected_hex, const std::string& actual_hex);

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

// Process exit code for each kind (0 is success, 1 is reserved for unexpected errors)
int exit_code(ErrorKind kind);

const char* error_kind_name(ErrorKind kind);

// "<what>: <path>: <strerror(errno)>"
IoError make_io_error(const std::string& what, const std::string& path);

} // namespace fsplit
