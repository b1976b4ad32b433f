#include "joiner.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include "fsplit/hex_utils.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace fsplit {

Joiner::Joiner(JoinOptions options) : options_(std::move(options)) {}

std::string Joiner::output_path_for(const MetadataRecord& metadata) const {
    if (!options_.output_path.empty()) {
        return options_.output_path;
    }
    return metadata.original_filename;
}

void Joiner::log(const std::string& line) {
    if (!options_.verbose) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cout << "[Joiner] " << line << std::endl;
}

void Joiner::check_output_not_an_input(const Manifest& manifest, const std::string& output_path) const {
    std::error_code ec;
    fs::path output(output_path);

    // A new file with a part or sidecar name would break the part set for later joins
    fs::path parent = output.parent_path().empty() ? fs::path(".") : output.parent_path();
    if (fs::equivalent(parent, manifest.parts_dir, ec)) {
        std::string name = output.filename().string();
        const std::string sidecar_extension = SIDECAR_EXTENSION;
        if (is_part_file_name(name, manifest.metadata.original_filename) ||
            (name.size() >= sidecar_extension.size() &&
             name.compare(name.size() - sidecar_extension.size(), sidecar_extension.size(),
                          sidecar_extension) == 0)) {
            throw UsageError("output path " + output_path + " would be taken for a part or sidecar of " +
                             manifest.parts_dir);
        }
    }

    if (!fs::exists(output, ec)) {
        return;
    }
    if (fs::equivalent(output, manifest.sidecar_path, ec)) {
        throw UsageError("output path " + output_path + " is the metadata sidecar");
    }
    for (const auto& part : manifest.parts) {
        if (fs::equivalent(output, part.path, ec)) {
            throw UsageError("output path " + output_path + " is part " + std::to_string(part.index));
        }
    }
}

std::string Joiner::join(const std::string& parts_dir) {
    if (options_.buffer_size == 0) {
        throw UsageError("buffer size must be greater than zero");
    }

    // Nothing is written before the whole manifest checks out
    Manifest manifest = load_manifest(parts_dir);
    const MetadataRecord& metadata = manifest.metadata;

    std::string output_path = output_path_for(metadata);
    check_output_not_an_input(manifest, output_path);

    unsigned workers = 1;
    if (options_.thread_count > 1 && metadata.part_count > 1) {
        workers = static_cast<unsigned>(std::min<uint64_t>(options_.thread_count, metadata.part_count));
    }

    log("Joining " + std::to_string(metadata.part_count) + " part(s) of " + metadata.original_filename +
        " into " + output_path + " using " + std::to_string(workers) + " thread(s)");

    std::vector<uint8_t> actual_hash;
    if (workers == 1) {
        actual_hash = join_sequential(manifest, output_path);
    } else {
        join_parallel(manifest, output_path, workers);
        if (metadata.has_hash()) {
            log("Verifying integrity...");
            actual_hash = hash_file(output_path, metadata.hash_algorithm, options_.buffer_size);
        }
    }

    log("File assembled: " + output_path + " (" + std::to_string(metadata.original_size) + " bytes)");

    if (metadata.has_hash()) {
        if (actual_hash != metadata.hash_value) {
            // The output is kept so the caller can inspect it
            log("Integrity check FAILED for " + output_path);
            throw IntegrityError(util::to_hex(metadata.hash_value), util::to_hex(actual_hash));
        }
        log(std::string("Integrity verified (") + hash_algorithm_name(metadata.hash_algorithm) + " " +
            util::to_hex(actual_hash) + ")");
    }
    return output_path;
}

std::vector<uint8_t> Joiner::join_sequential(const Manifest& manifest, const std::string& output_path) {
    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw make_io_error("cannot create output file", output_path);
    }

    Hasher hasher(manifest.metadata.hash_algorithm);
    std::vector<char> buffer(options_.buffer_size);

    for (const auto& part : manifest.parts) {
        stream_part(part, buffer, [&](const char* data, size_t len, uint64_t) {
            hasher.update(data, len);
            output.write(data, static_cast<std::streamsize>(len));
            if (!output) {
                throw make_io_error("failed to write output file", output_path);
            }
        });
        log("Added part " + part.path + " (" + std::to_string(part.size) + " bytes)");
    }

    output.close();
    if (!output) {
        throw make_io_error("failed to write output file", output_path);
    }
    return hasher.finalize();
}

void Joiner::copy_part_at(const PartEntry& part, util::FileHandle& output) {
    std::vector<char> buffer(options_.buffer_size);
    stream_part(part, buffer, [&](const char* data, size_t len, uint64_t offset_in_part) {
        output.write_at(data, len, part.offset + offset_in_part);
    });
    log("Wrote part " + part.path + " at offset " + std::to_string(part.offset) +
        " (" + std::to_string(part.size) + " bytes)");
}

void Joiner::join_parallel(const Manifest& manifest, const std::string& output_path, unsigned workers) {
    util::FileHandle output = util::FileHandle::create(output_path);
    output.resize(manifest.metadata.original_size);

    std::atomic<size_t> next_part{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    boost::asio::thread_pool pool(workers);
    for (unsigned w = 0; w < workers; ++w) {
        boost::asio::post(pool, [&]() {
            while (!failed.load()) {
                size_t i = next_part.fetch_add(1);
                if (i >= manifest.parts.size()) {
                    break;
                }
                try {
                    copy_part_at(manifest.parts[i], output);
                } catch (...) {
                    // Kept and rethrown once every worker has stopped
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                    failed = true;
                }
            }
        });
    }
    pool.join();

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    output.close();
}

} // namespace fsplit
