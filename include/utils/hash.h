#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace modelseal {

enum class HashAlgorithm {
    kBlake2b512,
    kSha256,
};

// Manifest identifiers: "BLAKE2b512", "SHA256".
const char* to_string(HashAlgorithm algorithm);
std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name);

size_t digest_size(HashAlgorithm algorithm);

// Incremental hash over OpenSSL EVP. Not copyable; finish() may be called once.
class Hasher {
public:
    explicit Hasher(HashAlgorithm algorithm);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    void update(const void* data, size_t size);
    std::vector<uint8_t> finish();

    HashAlgorithm algorithm() const { return algorithm_; }

private:
    HashAlgorithm algorithm_;
    EVP_MD_CTX* ctx_{nullptr};
    bool finished_{false};
};

std::vector<uint8_t> hash_bytes(HashAlgorithm algorithm, const void* data, size_t size);

}  // namespace modelseal
