#pragma once

#include "metadata.hpp"
#include <string>
#include <cstdint>
#include <cstddef>

namespace fsplit {

struct SplitOptions {
    uint64_t chunk_size = 0;
    bool verify_hash = false;
    size_t buffer_size = DEFAULT_BUFFER_SIZE;
    std::string output_dir;   // empty: <name>_parts in the working directory
    bool verbose = true;
};

class Splitter {
public:
    explicit Splitter(SplitOptions options);

    // Дробит файл на части и сохраняет .info рядом с ними
    MetadataRecord split(const std::string& source_path);

    // Directory the parts of source_path are written to
    std::string output_dir_for(const std::string& source_path) const;

private:
    // Removes the old sidecar and <name>.partNNN files left by a previous split
    void remove_stale_output(const std::string& dir, const std::string& base_name);

    SplitOptions options_;
};

} // namespace fsplit
