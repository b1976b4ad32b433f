#pragma once

#include "manifest.hpp"
#include "errors.hpp"
#include "fsplit/io_utils.hpp"
#include <algorithm>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace fsplit {

struct JoinOptions {
    std::string output_path;    // empty: original filename in the working directory
    unsigned thread_count = 0;  // 0 or 1: sequential
    size_t buffer_size = DEFAULT_BUFFER_SIZE;
    bool verbose = true;
};

// Feeds exactly part.size bytes of the part to sink(data, len, offset_in_part).
// A part that became shorter or longer since the manifest check is corruption.
template <typename Sink>
void stream_part(const PartEntry& part, std::vector<char>& buffer, Sink sink) {
    std::ifstream in(part.path, std::ios::binary);
    if (!in.is_open()) {
        throw make_io_error("cannot open part " + std::to_string(part.index), part.path);
    }

    uint64_t done = 0;
    while (done < part.size) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), part.size - done));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        std::streamsize count = in.gcount();
        if (in.bad()) {
            throw make_io_error("failed to read part " + std::to_string(part.index), part.path);
        }
        if (count <= 0) {
            break;
        }
        sink(buffer.data(), static_cast<size_t>(count), done);
        done += static_cast<uint64_t>(count);
    }

    if (done != part.size || in.peek() != std::ifstream::traits_type::eof()) {
        throw CorruptionError("part " + std::to_string(part.index) + " (" + part.path +
                              ") changed size during join", part.index);
    }
}

class Joiner {
public:
    explicit Joiner(JoinOptions options);

    // Собирает файл из частей. Returns the path of the reassembled file.
    std::string join(const std::string& parts_dir);

    std::string output_path_for(const MetadataRecord& metadata) const;

private:
    // Ascending order through one stream; returns the digest computed on the way
    std::vector<uint8_t> join_sequential(const Manifest& manifest, const std::string& output_path);

    // Pre-sized output, workers write parts at their offsets
    void join_parallel(const Manifest& manifest, const std::string& output_path, unsigned workers);

    void copy_part_at(const PartEntry& part, util::FileHandle& output);

    void check_output_not_an_input(const Manifest& manifest, const std::string& output_path) const;

    void log(const std::string& line);

    JoinOptions options_;
    std::mutex log_mutex_;
};

} // namespace fsplit
