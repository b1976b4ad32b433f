#pragma once

#include "hasher.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace fsplit {

// Current sidecar format version
const uint32_t FORMAT_VERSION = 1;

// Default read/write buffer (8 КБ)
const size_t DEFAULT_BUFFER_SIZE = 8192;

const char* const SIDECAR_EXTENSION = ".info";
const char* const PARTS_DIR_SUFFIX = "_parts";
const char* const PART_INFIX = ".part";

// Describes how a set of parts reassembles into the original file
struct MetadataRecord {
    std::string original_filename;
    uint64_t original_size = 0;
    uint64_t chunk_size = 0;
    uint64_t part_count = 0;
    HashAlgorithm hash_algorithm = HashAlgorithm::None;
    std::vector<uint8_t> hash_value;

    bool has_hash() const { return hash_algorithm != HashAlgorithm::None; }
};

// ceil(original_size / chunk_size); chunk_size must be > 0
uint64_t expected_part_count(uint64_t original_size, uint64_t chunk_size);

// Size of the 1-based part `index`
uint64_t expected_part_size(const MetadataRecord& metadata, uint64_t index);

// Byte offset of the 1-based part `index` in the original file
uint64_t part_offset(const MetadataRecord& metadata, uint64_t index);

// <original_filename>.partNNN, NNN padded to max(3, digits(part_count))
std::string part_file_name(const MetadataRecord& metadata, uint64_t index);

// True for <original_filename>.part<digits>, whatever the padding
bool is_part_file_name(const std::string& file_name, const std::string& original_filename);

// <original_filename>.info
std::string sidecar_file_name(const std::string& original_filename);

// Throws ParseError if the record breaks any invariant
void validate_metadata(const MetadataRecord& metadata);

std::string encode_metadata(const MetadataRecord& metadata);
MetadataRecord decode_metadata(const std::string& bytes);

// Сохраняет метаданные в .info файл (через временный файл + rename)
void save_metadata(const MetadataRecord& metadata, const std::string& path);

// Загружает метаданные из .info файла
MetadataRecord load_metadata(const std::string& path);

} // namespace fsplit
