#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace fsplit {
namespace util {

// --- Functions for printing digests ---
std::string to_hex(const std::vector<uint8_t>& bytes);

// Number of decimal digits in value (at least 1)
inline int decimal_digits(uint64_t value) {
    int digits = 1;
    while (value >= 10) {
        value /= 10;
        ++digits;
    }
    return digits;
}

} // namespace util
} // namespace fsplit
