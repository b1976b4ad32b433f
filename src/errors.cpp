#include "errors.hpp"
#include <cerrno>
#include <cstring>

namespace fsplit {

IntegrityError::IntegrityError(const std::string& expected_hex, const std::string& actual_hex)
    : Error(ErrorKind::Integrity,
            "hash mismatch: expected " + expected_hex + ", got " + actual_hex),
      expected_(expected_hex),
      actual_(actual_hex) {}

int exit_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Usage:      return 2;
        case ErrorKind::Io:         return 3;
        case ErrorKind::Parse:      return 4;
        case ErrorKind::Corruption: return 5;
        case ErrorKind::Integrity:  return 6;
    }
    return 1;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Usage:      return "usage error";
        case ErrorKind::Io:         return "I/O error";
        case ErrorKind::Parse:      return "parse error";
        case ErrorKind::Corruption: return "corruption error";
        case ErrorKind::Integrity:  return "integrity error";
    }
    return "error";
}

IoError make_io_error(const std::string& what, const std::string& path) {
    int saved = errno;
    std::string message = what + ": " + path;
    if (saved != 0) {
        message += ": ";
        message += std::strerror(saved);
    }
    return IoError(message);
}

} // namespace fsplit
