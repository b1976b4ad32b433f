#pragma once

#include "metadata.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace fsplit {

// The manifest check stops looking once this many problems are known
const size_t MAX_REPORTED_PROBLEMS = 32;

struct PartEntry {
    uint64_t index;        // 1-based
    std::string path;
    uint64_t offset;       // position in the reassembled file
    uint64_t size;
};

// Sidecar + the part files it describes, checked against the directory contents
struct Manifest {
    std::string parts_dir;
    std::string sidecar_path;
    MetadataRecord metadata;
    std::vector<PartEntry> parts;
};

// Returns the path of the only *.info file in parts_dir.
// Throws IoError if the directory is unusable, CorruptionError if there is not exactly one sidecar.
std::string find_sidecar(const std::string& parts_dir);

// Loads the sidecar and verifies that parts 1..part_count exist with their exact sizes
// and that no other part files of the same name are present. All problems are
// reported together in a single CorruptionError, up to MAX_REPORTED_PROBLEMS.
Manifest load_manifest(const std::string& parts_dir);

} // namespace fsplit
