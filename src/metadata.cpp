#include "metadata.hpp"
#include "errors.hpp"
#include "fsplit/hex_utils.hpp"
#include "fsplit.pb.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fsplit {

namespace {

DigestKind to_digest_kind(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Sha256 ? DIGEST_SHA256 : DIGEST_NONE;
}

HashAlgorithm from_digest_kind(DigestKind kind) {
    return kind == DIGEST_SHA256 ? HashAlgorithm::Sha256 : HashAlgorithm::None;
}

} // namespace

uint64_t expected_part_count(uint64_t original_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
    return original_size / chunk_size + (original_size % chunk_size != 0 ? 1 : 0);
}

uint64_t expected_part_size(const MetadataRecord& metadata, uint64_t index) {
    if (index == 0 || index > metadata.part_count) {
        throw std::out_of_range("part index " + std::to_string(index) + " out of range");
    }
    if (index < metadata.part_count) {
        return metadata.chunk_size;
    }
    return metadata.original_size - metadata.chunk_size * (metadata.part_count - 1);
}

uint64_t part_offset(const MetadataRecord& metadata, uint64_t index) {
    if (index == 0 || index > metadata.part_count) {
        throw std::out_of_range("part index " + std::to_string(index) + " out of range");
    }
    return (index - 1) * metadata.chunk_size;
}

std::string part_file_name(const MetadataRecord& metadata, uint64_t index) {
    int width = std::max(3, util::decimal_digits(metadata.part_count));
    std::ostringstream name;
    name << metadata.original_filename << PART_INFIX
         << std::setw(width) << std::setfill('0') << index;
    return name.str();
}

bool is_part_file_name(const std::string& file_name, const std::string& original_filename) {
    std::string prefix = original_filename + PART_INFIX;
    if (file_name.size() <= prefix.size() || file_name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return std::all_of(file_name.begin() + prefix.size(), file_name.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

std::string sidecar_file_name(const std::string& original_filename) {
    return original_filename + SIDECAR_EXTENSION;
}

void validate_metadata(const MetadataRecord& metadata) {
    const std::string& name = metadata.original_filename;
    if (name.empty()) {
        throw ParseError("metadata has an empty original filename");
    }
    if (name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos) {
        throw ParseError("original filename '" + name + "' is not a plain file name");
    }
    if (metadata.chunk_size == 0) {
        throw ParseError("metadata has a zero chunk size");
    }

    uint64_t expected = expected_part_count(metadata.original_size, metadata.chunk_size);
    if (metadata.part_count != expected) {
        throw ParseError("part count " + std::to_string(metadata.part_count) +
                         " does not match size " + std::to_string(metadata.original_size) +
                         " / chunk " + std::to_string(metadata.chunk_size) +
                         " (expected " + std::to_string(expected) + ")");
    }

    size_t digest_len = digest_size(metadata.hash_algorithm);
    if (metadata.hash_value.size() != digest_len) {
        throw ParseError(std::string("hash value has ") + std::to_string(metadata.hash_value.size()) +
                         " bytes, expected " + std::to_string(digest_len) + " for " +
                         hash_algorithm_name(metadata.hash_algorithm));
    }
}

std::string encode_metadata(const MetadataRecord& metadata) {
    Sidecar sidecar;
    sidecar.set_format_version(FORMAT_VERSION);
    sidecar.set_original_filename(metadata.original_filename);
    sidecar.set_original_size(metadata.original_size);
    sidecar.set_chunk_size(metadata.chunk_size);
    sidecar.set_part_count(metadata.part_count);
    if (metadata.has_hash()) {
        sidecar.set_hash_algorithm(to_digest_kind(metadata.hash_algorithm));
        sidecar.set_hash_value(metadata.hash_value.data(), metadata.hash_value.size());
    }

    std::string bytes;
    if (!sidecar.SerializeToString(&bytes)) {
        throw std::runtime_error("failed to serialize metadata");
    }
    return bytes;
}

MetadataRecord decode_metadata(const std::string& bytes) {
    Sidecar sidecar;
    if (!sidecar.ParseFromString(bytes)) {
        // Also covers missing required fields
        throw ParseError("metadata is malformed, truncated or missing required fields");
    }
    if (sidecar.format_version() != FORMAT_VERSION) {
        throw ParseError("unsupported metadata format version " +
                         std::to_string(sidecar.format_version()));
    }
    if (sidecar.has_hash_value() && !sidecar.has_hash_algorithm()) {
        throw ParseError("metadata has a hash value but no known hash algorithm");
    }

    MetadataRecord metadata;
    metadata.original_filename = sidecar.original_filename();
    metadata.original_size = sidecar.original_size();
    metadata.chunk_size = sidecar.chunk_size();
    metadata.part_count = sidecar.part_count();
    metadata.hash_algorithm = from_digest_kind(sidecar.hash_algorithm());
    metadata.hash_value.assign(sidecar.hash_value().begin(), sidecar.hash_value().end());

    validate_metadata(metadata);
    return metadata;
}

void save_metadata(const MetadataRecord& metadata, const std::string& path) {
    std::string bytes = encode_metadata(metadata);
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream metadata_file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!metadata_file.is_open()) {
            throw make_io_error("cannot create metadata file", tmp_path);
        }
        metadata_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        metadata_file.close();
        if (!metadata_file) {
            throw make_io_error("failed to write metadata file", tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        throw IoError("cannot move metadata into place: " + path + ": " + ec.message());
    }
}

MetadataRecord load_metadata(const std::string& path) {
    std::ifstream metadata_file(path, std::ios::binary);
    // A sidecar that cannot be read is as useless as a malformed one
    if (!metadata_file.is_open()) {
        throw ParseError(make_io_error("cannot open metadata file", path).what());
    }

    std::ostringstream contents;
    contents << metadata_file.rdbuf();
    if (metadata_file.bad()) {
        throw ParseError(make_io_error("failed to read metadata file", path).what());
    }

    try {
        return decode_metadata(contents.str());
    } catch (const ParseError& e) {
        throw ParseError(path + ": " + e.what());
    }
}

} // namespace fsplit
