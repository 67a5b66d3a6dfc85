#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>

#include "utils/hash.h"

namespace modelseal {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

constexpr size_t kEd25519PublicKeySize = 32;
constexpr size_t kEd25519SignatureSize = 64;

class PublicKey {
public:
    explicit PublicKey(EvpPkeyPtr key);

    // Raw 32-byte Ed25519 public key.
    std::vector<uint8_t> raw_bytes() const;
    // Hash of raw_bytes(); identifies the signer inside a manifest.
    std::vector<uint8_t> fingerprint(HashAlgorithm algorithm) const;

    bool verify(const std::vector<uint8_t>& message, const std::vector<uint8_t>& signature) const;

    EVP_PKEY* get() const { return key_.get(); }

private:
    EvpPkeyPtr key_;
};

// Private keys never leave this object except through save_private().
class PrivateKey {
public:
    explicit PrivateKey(EvpPkeyPtr key);

    PublicKey public_key() const;
    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

    EVP_PKEY* get() const { return key_.get(); }

private:
    EvpPkeyPtr key_;
};

struct KeyPair {
    PrivateKey private_key;
    PublicKey public_key;
};

// Ed25519 key generation, persistence and raw signing primitives.
// Every failure is reported as SealError(kInvalidKeyMaterial), or kIoError
// when a key file cannot be written.
class KeyManager {
public:
    static KeyPair generate();

    // PKCS#8 DER; PEM ("BEGIN PRIVATE KEY") is accepted as well.
    static PrivateKey load_private(const std::filesystem::path& path);
    // Raw 32 bytes; PEM or DER SubjectPublicKeyInfo are accepted as well.
    static PublicKey load_public(const std::filesystem::path& path);

    static PrivateKey private_from_bytes(const std::string& bytes);
    static PublicKey public_from_bytes(const std::string& bytes);

    // Owner read/write only.
    static void save_private(const PrivateKey& key, const std::filesystem::path& path);
    static void save_public(const PublicKey& key, const std::filesystem::path& path);

    // Generates a pair and writes both halves. Refuses to write both halves
    // to the same file.
    static KeyPair write_key_pair(const std::filesystem::path& private_path,
                                  const std::filesystem::path& public_path);
};

}  // namespace modelseal
