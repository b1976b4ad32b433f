#include "splitter.hpp"
#include "errors.hpp"
#include "fsplit/hex_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace fsplit {

Splitter::Splitter(SplitOptions options) : options_(std::move(options)) {}

std::string Splitter::output_dir_for(const std::string& source_path) const {
    if (!options_.output_dir.empty()) {
        return options_.output_dir;
    }
    return fs::path(source_path).filename().string() + PARTS_DIR_SUFFIX;
}

void Splitter::remove_stale_output(const std::string& dir, const std::string& base_name) {
    std::error_code ec;
    fs::path sidecar = fs::path(dir) / sidecar_file_name(base_name);
    // The sidecar goes first so an interrupted split never pairs an old sidecar with new parts
    fs::remove(sidecar, ec);
    if (ec) {
        throw IoError("cannot remove old sidecar " + sidecar.string() + ": " + ec.message());
    }

    std::vector<fs::path> stale;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (is_part_file_name(it->path().filename().string(), base_name)) {
            stale.push_back(it->path());
        }
    }
    if (ec) {
        throw IoError("cannot list output directory " + dir + ": " + ec.message());
    }

    for (const auto& path : stale) {
        fs::remove(path, ec);
        if (ec) {
            throw IoError("cannot remove old part " + path.string() + ": " + ec.message());
        }
    }
    if (!stale.empty() && options_.verbose) {
        std::cout << "[Splitter] Removed " << stale.size() << " part(s) left from a previous split" << std::endl;
    }
}

MetadataRecord Splitter::split(const std::string& source_path) {
    if (options_.chunk_size == 0) {
        throw UsageError("chunk size must be greater than zero");
    }
    if (options_.buffer_size == 0) {
        throw UsageError("buffer size must be greater than zero");
    }

    std::error_code ec;
    fs::file_status status = fs::status(source_path, ec);
    if (!fs::exists(status)) {
        throw IoError("source file not found: " + source_path);
    }
    if (!fs::is_regular_file(status)) {
        throw IoError("not a regular file: " + source_path);
    }

    std::ifstream source(source_path, std::ios::binary);
    if (!source.is_open()) {
        throw make_io_error("cannot open source file", source_path);
    }

    uint64_t file_size = fs::file_size(source_path, ec);
    if (ec) {
        throw IoError("cannot stat source file " + source_path + ": " + ec.message());
    }

    MetadataRecord metadata;
    metadata.original_filename = fs::path(source_path).filename().string();
    metadata.original_size = file_size;
    metadata.chunk_size = options_.chunk_size;
    metadata.part_count = expected_part_count(file_size, options_.chunk_size);
    metadata.hash_algorithm = options_.verify_hash ? HashAlgorithm::Sha256 : HashAlgorithm::None;

    std::string dir = output_dir_for(source_path);
    fs::create_directories(dir, ec);
    if (ec) {
        throw IoError("cannot create output directory " + dir + ": " + ec.message());
    }
    remove_stale_output(dir, metadata.original_filename);

    if (options_.verbose && options_.verify_hash) {
        std::cout << "[Splitter] Computing SHA-256 of " << source_path << " while splitting..." << std::endl;
    }

    Hasher hasher(metadata.hash_algorithm);
    std::vector<char> buffer(options_.buffer_size);

    std::ofstream part;
    std::string part_path;
    uint64_t part_index = 0;
    uint64_t bytes_in_part = 0;
    uint64_t bytes_read = 0;

    auto finish_part = [&]() {
        part.close();
        if (!part) {
            throw make_io_error("failed to write part", part_path);
        }
        if (options_.verbose) {
            std::cout << "[Splitter] Created part " << part_path << " (" << bytes_in_part << " bytes)" << std::endl;
        }
    };

    while (source) {
        source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = source.gcount();
        if (count <= 0) {
            break;
        }
        bytes_read += static_cast<uint64_t>(count);
        if (bytes_read > file_size) {
            throw IoError("source file grew while being split: " + source_path);
        }
        hasher.update(buffer.data(), static_cast<size_t>(count));

        // One read may finish the current part and start the next one
        size_t pos = 0;
        while (pos < static_cast<size_t>(count)) {
            if (!part.is_open()) {
                ++part_index;
                part_path = (fs::path(dir) / part_file_name(metadata, part_index)).string();
                bytes_in_part = 0;
                part.open(part_path, std::ios::binary | std::ios::trunc);
                if (!part.is_open()) {
                    throw make_io_error("cannot create part", part_path);
                }
            }

            uint64_t room = options_.chunk_size - bytes_in_part;
            size_t n = static_cast<size_t>(std::min<uint64_t>(room, static_cast<size_t>(count) - pos));
            part.write(buffer.data() + pos, static_cast<std::streamsize>(n));
            if (!part) {
                throw make_io_error("failed to write part", part_path);
            }
            pos += n;
            bytes_in_part += n;

            if (bytes_in_part == options_.chunk_size) {
                finish_part();
            }
        }
    }
    if (source.bad()) {
        throw make_io_error("failed to read source file", source_path);
    }
    if (part.is_open()) {
        finish_part();
    }
    if (bytes_read != file_size) {
        throw IoError("source file changed size while being split: expected " + std::to_string(file_size) +
                      " bytes, read " + std::to_string(bytes_read));
    }

    metadata.hash_value = hasher.finalize();

    std::string sidecar_path = (fs::path(dir) / sidecar_file_name(metadata.original_filename)).string();
    save_metadata(metadata, sidecar_path);

    if (options_.verbose) {
        if (metadata.has_hash()) {
            std::cout << "[Splitter] SHA-256: " << util::to_hex(metadata.hash_value) << std::endl;
        }
        std::cout << "[Splitter] Split " << source_path << " (" << file_size << " bytes) into "
                  << metadata.part_count << " part(s) in '" << dir << "'" << std::endl;
    }
    return metadata;
}

} // namespace fsplit
