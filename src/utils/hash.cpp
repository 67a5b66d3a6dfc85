#include "utils/hash.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "core/seal_error.h"

namespace modelseal {

namespace {
const EVP_MD* evp_for(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::kBlake2b512:
            return EVP_blake2b512();
        case HashAlgorithm::kSha256:
            return EVP_sha256();
    }
    return nullptr;
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}  // namespace

const char* to_string(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::kBlake2b512:
            return "BLAKE2b512";
        case HashAlgorithm::kSha256:
            return "SHA256";
    }
    return "UNKNOWN";
}

std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name) {
    const std::string upper = to_upper(name);
    if (upper == "BLAKE2B512" || upper == "BLAKE2B-512") return HashAlgorithm::kBlake2b512;
    if (upper == "SHA256" || upper == "SHA-256") return HashAlgorithm::kSha256;
    return std::nullopt;
}

size_t digest_size(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::kBlake2b512:
            return 64;
        case HashAlgorithm::kSha256:
            return 32;
    }
    return 0;
}

Hasher::Hasher(HashAlgorithm algorithm) : algorithm_(algorithm) {
    const EVP_MD* md = evp_for(algorithm);
    if (!md) {
        throw SealError(ErrorCode::kUnsupportedAlgorithm,
                        std::string("hash algorithm not available: ") + to_string(algorithm));
    }
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Hasher::~Hasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Hasher::update(const void* data, size_t size) {
    if (finished_) throw std::logic_error("Hasher::update after finish");
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::vector<uint8_t> Hasher::finish() {
    if (finished_) throw std::logic_error("Hasher::finish called twice");
    finished_ = true;
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    out.resize(len);
    return out;
}

std::vector<uint8_t> hash_bytes(HashAlgorithm algorithm, const void* data, size_t size) {
    Hasher hasher(algorithm);
    hasher.update(data, size);
    return hasher.finish();
}

}  // namespace modelseal
