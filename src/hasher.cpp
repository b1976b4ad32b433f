#include "hasher.hpp"
#include "errors.hpp"
#include <fstream>

namespace fsplit {

const char* hash_algorithm_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::None:   return "none";
        case HashAlgorithm::Sha256: return "sha256";
    }
    return "unknown";
}

size_t digest_size(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Sha256 ? 32 : 0;
}

Hasher::Hasher(HashAlgorithm algorithm)
    : algorithm_(algorithm),
      mdctx_(nullptr, &EVP_MD_CTX_free)
{
    if (!enabled()) {
        return;
    }

    mdctx_.reset(EVP_MD_CTX_new());
    if (!mdctx_ || EVP_DigestInit_ex(mdctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("failed to initialize SHA-256 context");
    }
}

void Hasher::update(const char* data, size_t len) {
    if (finalized_) {
        throw std::logic_error("Hasher::update called after finalize");
    }
    if (!enabled() || len == 0) {
        return;
    }
    if (EVP_DigestUpdate(mdctx_.get(), data, len) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::vector<uint8_t> Hasher::finalize() {
    if (finalized_) {
        throw std::logic_error("Hasher::finalize called twice");
    }
    finalized_ = true;
    if (!enabled()) {
        return {};
    }

    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx_.get(), hash.data(), &hash_len) != 1) {
        throw std::runtime_error("SHA-256 finalize failed");
    }
    hash.resize(hash_len);
    return hash;
}

std::vector<uint8_t> hash_file(const std::string& path, HashAlgorithm algorithm, size_t buffer_size) {
    if (buffer_size == 0) {
        throw UsageError("buffer size must be greater than zero");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw make_io_error("cannot open file for hashing", path);
    }

    Hasher hasher(algorithm);
    std::vector<char> buffer(buffer_size);
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize count = file.gcount();
        if (count > 0) {
            hasher.update(buffer.data(), static_cast<size_t>(count));
        }
    }
    if (file.bad()) {
        throw make_io_error("read failed while hashing", path);
    }
    return hasher.finalize();
}

} // namespace fsplit
