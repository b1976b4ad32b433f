#include <iostream>
#include "cli.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "fsplit/hex_utils.hpp"

namespace {

void print_metadata(const std::string& sidecar_path, const fsplit::MetadataRecord& metadata) {
    std::cout << "Sidecar:        " << sidecar_path << "\n"
              << "Original name:  " << metadata.original_filename << "\n"
              << "Original size:  " << metadata.original_size << " bytes\n"
              << "Chunk size:     " << metadata.chunk_size << " bytes\n"
              << "Parts:          " << metadata.part_count << "\n"
              << "Hash:           " << fsplit::hash_algorithm_name(metadata.hash_algorithm);
    if (metadata.has_hash()) {
        std::cout << " " << fsplit::util::to_hex(metadata.hash_value);
    }
    std::cout << std::endl;
}

int run_info(const std::string& parts_dir) {
    std::string sidecar_path = fsplit::find_sidecar(parts_dir);
    print_metadata(sidecar_path, fsplit::load_metadata(sidecar_path));

    // Throws CorruptionError with the list of bad parts
    fsplit::Manifest manifest = fsplit::load_manifest(parts_dir);
    std::cout << "Manifest OK: all " << manifest.parts.size() << " part(s) present with expected sizes" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        fsplit::Args args = fsplit::parse_cli(argc, argv);

        switch (args.command) {
            case fsplit::Command::Help:
                std::cout << fsplit::USAGE;
                return 0;
            case fsplit::Command::Split: {
                fsplit::Splitter splitter(args.split);
                splitter.split(args.path);
                return 0;
            }
            case fsplit::Command::Join: {
                fsplit::Joiner joiner(args.join);
                joiner.join(args.path);
                return 0;
            }
            case fsplit::Command::Info:
                return run_info(args.path);
        }
    } catch (const fsplit::UsageError& e) {
        std::cerr << "error: " << e.what() << "\n" << fsplit::USAGE;
        return fsplit::exit_code(e.kind());
    } catch (const fsplit::Error& e) {
        std::cerr << "error (" << fsplit::error_kind_name(e.kind()) << "): " << e.what() << std::endl;
        return fsplit::exit_code(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    return 1;
}
