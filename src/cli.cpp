#include "cli.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace fsplit {

const char* const USAGE =
"Usage:\n"
"  fsplit split <file> <chunk_size> [--verify-hash] [--buffer-size N] [--output-dir DIR] [-q|--quiet]\n"
"  fsplit join <parts_directory> [-o|--output PATH] [-t|--threads N] [--buffer-size N] [-q|--quiet]\n"
"  fsplit info <parts_directory>\n"
"  fsplit help\n"
"Sizes accept K, M and G suffixes (powers of 1024). --threads 0 or 1 joins sequentially.\n";

uint64_t parse_byte_count(const std::string& text, const std::string& what) {
    if (text.empty()) {
        throw UsageError(what + " is empty");
    }

    size_t pos = 0;
    uint64_t value = 0;
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        uint64_t digit = static_cast<uint64_t>(text[pos] - '0');
        if (value > (max - digit) / 10) {
            throw UsageError(what + " is too large: " + text);
        }
        value = value * 10 + digit;
        ++pos;
    }
    if (pos == 0) {
        throw UsageError(what + " must be a non-negative number, got '" + text + "'");
    }

    uint64_t multiplier = 1;
    if (pos < text.size()) {
        switch (std::toupper(static_cast<unsigned char>(text[pos]))) {
            case 'K': multiplier = 1ULL << 10; break;
            case 'M': multiplier = 1ULL << 20; break;
            case 'G': multiplier = 1ULL << 30; break;
            default:
                throw UsageError("invalid " + what + " '" + text + "'");
        }
        if (pos + 1 != text.size()) {
            throw UsageError("invalid " + what + " '" + text + "'");
        }
    }
    if (value > max / multiplier) {
        throw UsageError(what + " is too large: " + text);
    }
    return value * multiplier;
}

namespace {

unsigned parse_thread_count(const std::string& text) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw UsageError("thread count must be a plain number, got '" + text + "'");
    }
    uint64_t value = parse_byte_count(text, "thread count");
    if (value > 1024) {
        throw UsageError("thread count " + text + " is too large (max 1024)");
    }
    return static_cast<unsigned>(value);
}

} // namespace

Args parse_cli(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_cli(args);
}

Args parse_cli(const std::vector<std::string>& args) {
    Args a;
    if (args.empty()) {
        throw UsageError("missing command");
    }

    const std::string& mode = args[0];
    if (mode == "help" || mode == "-h" || mode == "--help") {
        a.command = Command::Help;
        return a;
    } else if (mode == "split") {
        a.command = Command::Split;
    } else if (mode == "join") {
        a.command = Command::Join;
    } else if (mode == "info") {
        a.command = Command::Info;
    } else {
        throw UsageError("unknown command '" + mode + "'");
    }

    std::vector<std::string> positional;
    size_t i = 1;
    while (i < args.size()) {
        std::string f = args[i++];
        std::string value;
        bool has_inline_value = false;
        if (f.compare(0, 2, "--") == 0) {
            size_t eq = f.find('=');
            if (eq != std::string::npos) {
                value = f.substr(eq + 1);
                f = f.substr(0, eq);
                has_inline_value = true;
            }
        }
        auto next = [&]() -> std::string {
            if (has_inline_value) {
                return value;
            }
            if (i >= args.size()) {
                throw UsageError("missing value after " + f);
            }
            return args[i++];
        };

        bool is_switch = f == "-q" || f == "--quiet" || f == "--verify-hash";
        if (is_switch && has_inline_value) {
            throw UsageError("option " + f + " does not take a value");
        }

        if (f.empty() || f[0] != '-' || f == "-") {
            positional.push_back(f);
        } else if (f == "-q" || f == "--quiet") {
            a.split.verbose = false;
            a.join.verbose = false;
        } else if (f == "--buffer-size" && a.command != Command::Info) {
            uint64_t size = parse_byte_count(next(), "buffer size");
            if (size == 0) {
                throw UsageError("buffer size must be greater than zero");
            }
            a.split.buffer_size = static_cast<size_t>(size);
            a.join.buffer_size = static_cast<size_t>(size);
        } else if (f == "--verify-hash" && a.command == Command::Split) {
            a.split.verify_hash = true;
        } else if (f == "--output-dir" && a.command == Command::Split) {
            a.split.output_dir = next();
        } else if ((f == "-o" || f == "--output") && a.command == Command::Join) {
            a.join.output_path = next();
        } else if ((f == "-t" || f == "--threads") && a.command == Command::Join) {
            a.join.thread_count = parse_thread_count(next());
        } else {
            throw UsageError("unknown option " + f + " for " + mode);
        }
    }

    size_t expected = a.command == Command::Split ? 2 : 1;
    if (positional.size() < expected) {
        throw UsageError(a.command == Command::Split ? "split needs <file> and <chunk_size>"
                                                     : mode + " needs <parts_directory>");
    }
    if (positional.size() > expected) {
        throw UsageError("unexpected argument '" + positional[expected] + "'");
    }

    a.path = positional[0];
    if (a.command == Command::Split) {
        a.split.chunk_size = parse_byte_count(positional[1], "chunk size");
        if (a.split.chunk_size == 0) {
            throw UsageError("chunk size must be greater than zero");
        }
    }
    return a;
}

} // namespace fsplit
