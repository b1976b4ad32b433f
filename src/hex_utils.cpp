#include "fsplit/hex_utils.hpp"
#include <iomanip>
#include <sstream>

namespace fsplit {
namespace util {

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (uint8_t c : bytes) {
        hex_stream << std::setw(2) << static_cast<int>(c);
    }
    return hex_stream.str();
}

} // namespace util
} // namespace fsplit
