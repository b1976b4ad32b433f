#pragma once

#include "splitter.hpp"
#include "joiner.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace fsplit {

enum class Command { Split, Join, Info, Help };

struct Args {
    Command command = Command::Help;
    std::string path;       // source file for split, parts directory for join/info
    SplitOptions split;
    JoinOptions join;
};

extern const char* const USAGE;

// Throws UsageError on bad or missing arguments
Args parse_cli(int argc, char** argv);
Args parse_cli(const std::vector<std::string>& args);

// "4096", "64K", "16M", "1G" (powers of 1024)
uint64_t parse_byte_count(const std::string& text, const std::string& what);

} // namespace fsplit
