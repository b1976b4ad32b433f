#pragma once

#include <openssl/evp.h>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace fsplit {

// Helper for managing EVP_MD_CTX context
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

enum class HashAlgorithm {
    None,
    Sha256
};

// "none" / "sha256"
const char* hash_algorithm_name(HashAlgorithm algorithm);

// Digest length in bytes (0 for None)
size_t digest_size(HashAlgorithm algorithm);

// Incremental whole-file digest. None accepts data and finalizes to an empty digest.
class Hasher {
public:
    explicit Hasher(HashAlgorithm algorithm);

    void update(const char* data, size_t len);
    std::vector<uint8_t> finalize();

    bool enabled() const { return algorithm_ != HashAlgorithm::None; }

private:
    HashAlgorithm algorithm_;
    EVP_MD_CTX_ptr mdctx_;
    bool finalized_ = false;
};

// Reads the whole file through a Hasher, buffer_size bytes at a time
std::vector<uint8_t> hash_file(const std::string& path, HashAlgorithm algorithm, size_t buffer_size);

} // namespace fsplit
