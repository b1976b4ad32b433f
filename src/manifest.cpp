#include "manifest.hpp"
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace fsplit {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<fs::directory_entry> list_directory(const std::string& parts_dir) {
    std::error_code ec;
    if (!fs::exists(parts_dir, ec)) {
        throw IoError("parts directory not found: " + parts_dir);
    }
    if (!fs::is_directory(parts_dir, ec)) {
        throw IoError("not a directory: " + parts_dir);
    }

    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(parts_dir, ec);
    if (ec) {
        throw IoError("cannot list parts directory " + parts_dir + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw IoError("cannot list parts directory " + parts_dir + ": " + ec.message());
        }
        entries.push_back(*it);
    }
    if (ec) {
        throw IoError("cannot list parts directory " + parts_dir + ": " + ec.message());
    }
    return entries;
}

} // namespace

std::string find_sidecar(const std::string& parts_dir) {
    std::vector<std::string> sidecars;
    for (const auto& entry : list_directory(parts_dir)) {
        std::error_code ec;
        if (entry.is_regular_file(ec) && ends_with(entry.path().filename().string(), SIDECAR_EXTENSION)) {
            sidecars.push_back(entry.path().string());
        }
    }

    if (sidecars.empty()) {
        throw CorruptionError("no metadata sidecar (*" + std::string(SIDECAR_EXTENSION) +
                              ") found in " + parts_dir);
    }
    if (sidecars.size() > 1) {
        std::sort(sidecars.begin(), sidecars.end());
        std::string names;
        for (const auto& s : sidecars) {
            names += (names.empty() ? "" : ", ") + fs::path(s).filename().string();
        }
        throw CorruptionError("expected exactly one metadata sidecar in " + parts_dir +
                              ", found " + std::to_string(sidecars.size()) + ": " + names);
    }
    return sidecars.front();
}

Manifest load_manifest(const std::string& parts_dir) {
    Manifest manifest;
    manifest.parts_dir = parts_dir;
    manifest.sidecar_path = find_sidecar(parts_dir);
    manifest.metadata = load_metadata(manifest.sidecar_path);

    const MetadataRecord& metadata = manifest.metadata;
    std::vector<fs::directory_entry> entries = list_directory(parts_dir);

    std::vector<std::string> problems;
    uint64_t first_bad_index = 0;
    auto report = [&](uint64_t index, const std::string& problem) {
        if (first_bad_index == 0 || (index != 0 && index < first_bad_index)) {
            first_bad_index = index;
        }
        problems.push_back(problem);
    };
    auto full = [&]() { return problems.size() >= MAX_REPORTED_PROBLEMS; };

    // A sidecar may claim far more parts than the directory could hold
    std::set<std::string> expected_names;
    manifest.parts.reserve(static_cast<size_t>(std::min<uint64_t>(metadata.part_count, entries.size())));
    for (uint64_t index = 1; index <= metadata.part_count && !full(); ++index) {
        std::string name = part_file_name(metadata, index);
        expected_names.insert(name);

        PartEntry part;
        part.index = index;
        part.path = (fs::path(parts_dir) / name).string();
        part.offset = part_offset(metadata, index);
        part.size = expected_part_size(metadata, index);

        std::error_code ec;
        fs::file_status status = fs::status(part.path, ec);
        if (!fs::exists(status)) {
            report(index, "part " + std::to_string(index) + " is missing (" + name + ")");
        } else if (!fs::is_regular_file(status)) {
            report(index, "part " + std::to_string(index) + " is not a regular file (" + name + ")");
        } else {
            uint64_t actual = fs::file_size(part.path, ec);
            if (ec) {
                throw IoError("cannot stat part " + part.path + ": " + ec.message());
            }
            if (actual != part.size) {
                report(index, "part " + std::to_string(index) + " (" + name + ") has " +
                              std::to_string(actual) + " bytes, expected " + std::to_string(part.size));
            }
        }
        manifest.parts.push_back(part);
    }

    // After an early stop expected_names is incomplete, so extras are not judged
    bool truncated = manifest.parts.size() < metadata.part_count;
    if (!truncated) {
        std::vector<std::string> extras;
        for (const auto& entry : entries) {
            std::string file_name = entry.path().filename().string();
            if (is_part_file_name(file_name, metadata.original_filename) &&
                expected_names.count(file_name) == 0) {
                extras.push_back(file_name);
            }
        }
        std::sort(extras.begin(), extras.end());
        for (const auto& extra : extras) {
            report(0, "unexpected part file " + extra);
        }
    }

    if (!problems.empty()) {
        std::string message = "manifest check failed for " + parts_dir + ": ";
        for (size_t i = 0; i < problems.size(); ++i) {
            message += (i == 0 ? "" : "; ") + problems[i];
        }
        if (truncated) {
            message += "; further problems not listed";
        }
        throw CorruptionError(message, first_bad_index);
    }

    return manifest;
}

} // namespace fsplit
