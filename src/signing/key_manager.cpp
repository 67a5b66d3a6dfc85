#include "signing/key_manager.h"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

#include "core/seal_error.h"
#include "utils/atomic_file.h"

namespace fs = std::filesystem;

namespace modelseal {

namespace {

constexpr size_t MAX_KEY_FILE_SIZE = 64 * 1024;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::string openssl_error() {
    unsigned long err = ERR_get_error();
    ERR_clear_error();
    if (err == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

[[noreturn]] void invalid_key(const std::string& message) {
    throw SealError(ErrorCode::kInvalidKeyMaterial, message);
}

EvpPkeyPtr require_ed25519(EvpPkeyPtr key, const char* what) {
    if (!key) invalid_key(std::string("cannot decode ") + what + " (" + openssl_error() + ")");
    if (EVP_PKEY_id(key.get()) != EVP_PKEY_ED25519) {
        invalid_key(std::string(what) + " is not an Ed25519 key");
    }
    return key;
}

bool looks_like_pem(const std::string& bytes) {
    return bytes.find("-----BEGIN ") != std::string::npos;
}

std::string read_key_file(const fs::path& path) {
    try {
        return read_file_bytes(path, MAX_KEY_FILE_SIZE);
    } catch (const SealError& e) {
        throw SealError(ErrorCode::kInvalidKeyMaterial, std::string("cannot read key file: ") + e.what());
    }
}

}  // namespace

PublicKey::PublicKey(EvpPkeyPtr key) : key_(require_ed25519(std::move(key), "public key")) {}

std::vector<uint8_t> PublicKey::raw_bytes() const {
    std::vector<uint8_t> out(kEd25519PublicKeySize);
    size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), out.data(), &len) != 1 || len != kEd25519PublicKeySize) {
        invalid_key("cannot export public key (" + openssl_error() + ")");
    }
    return out;
}

std::vector<uint8_t> PublicKey::fingerprint(HashAlgorithm algorithm) const {
    const auto raw = raw_bytes();
    return hash_bytes(algorithm, raw.data(), raw.size());
}

bool PublicKey::verify(const std::vector<uint8_t>& message, const std::vector<uint8_t>& signature) const {
    if (signature.size() != kEd25519SignatureSize) return false;
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) invalid_key("cannot allocate verification context");
    // Ed25519 is a one-shot scheme: no message digest is configured.
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        invalid_key("cannot initialize verification (" + openssl_error() + ")");
    }
    int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size());
    if (rc != 1) ERR_clear_error();
    return rc == 1;
}

PrivateKey::PrivateKey(EvpPkeyPtr key) : key_(require_ed25519(std::move(key), "private key")) {}

PublicKey PrivateKey::public_key() const {
    uint8_t raw[kEd25519PublicKeySize];
    size_t len = sizeof(raw);
    if (EVP_PKEY_get_raw_public_key(key_.get(), raw, &len) != 1 || len != sizeof(raw)) {
        invalid_key("cannot derive public key (" + openssl_error() + ")");
    }
    return PublicKey(EvpPkeyPtr(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, raw, len)));
}

std::vector<uint8_t> PrivateKey::sign(const std::vector<uint8_t>& message) const {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) invalid_key("cannot allocate signing context");
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        invalid_key("cannot initialize signing (" + openssl_error() + ")");
    }
    std::vector<uint8_t> signature(kEd25519SignatureSize);
    size_t len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &len, message.data(), message.size()) != 1 ||
        len != kEd25519SignatureSize) {
        invalid_key("signing failed (" + openssl_error() + ")");
    }
    return signature;
}

KeyPair KeyManager::generate() {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        invalid_key("cannot initialize key generation (" + openssl_error() + ")");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        invalid_key("key generation failed (" + openssl_error() + ")");
    }
    PrivateKey private_key{EvpPkeyPtr(raw)};
    PublicKey public_key = private_key.public_key();
    return KeyPair{std::move(private_key), std::move(public_key)};
}

PrivateKey KeyManager::private_from_bytes(const std::string& bytes) {
    if (looks_like_pem(bytes)) {
        BioPtr bio(BIO_new_mem_buf(bytes.data(), static_cast<int>(bytes.size())));
        if (!bio) invalid_key("cannot allocate key buffer");
        return PrivateKey(EvpPkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)));
    }
    const auto* begin = reinterpret_cast<const unsigned char*>(bytes.data());
    const auto* p = begin;
    EvpPkeyPtr key(d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(bytes.size())));
    if (key && p != begin + bytes.size()) invalid_key("trailing data after private key");
    return PrivateKey(std::move(key));
}

PublicKey KeyManager::public_from_bytes(const std::string& bytes) {
    if (bytes.size() == kEd25519PublicKeySize) {
        const auto* raw = reinterpret_cast<const unsigned char*>(bytes.data());
        return PublicKey(EvpPkeyPtr(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, raw, bytes.size())));
    }
    if (looks_like_pem(bytes)) {
        BioPtr bio(BIO_new_mem_buf(bytes.data(), static_cast<int>(bytes.size())));
        if (!bio) invalid_key("cannot allocate key buffer");
        return PublicKey(EvpPkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr)));
    }
    const auto* begin = reinterpret_cast<const unsigned char*>(bytes.data());
    const auto* p = begin;
    EvpPkeyPtr key(d2i_PUBKEY(nullptr, &p, static_cast<long>(bytes.size())));
    if (key && p != begin + bytes.size()) invalid_key("trailing data after public key");
    return PublicKey(std::move(key));
}

PrivateKey KeyManager::load_private(const fs::path& path) {
    return private_from_bytes(read_key_file(path));
}

PublicKey KeyManager::load_public(const fs::path& path) {
    return public_from_bytes(read_key_file(path));
}

void KeyManager::save_private(const PrivateKey& key, const fs::path& path) {
    std::unique_ptr<PKCS8_PRIV_KEY_INFO, decltype(&PKCS8_PRIV_KEY_INFO_free)> info(EVP_PKEY2PKCS8(key.get()),
                                                                                 &PKCS8_PRIV_KEY_INFO_free);
    if (!info) invalid_key("cannot encode private key (" + openssl_error() + ")");
    unsigned char* der = nullptr;
    int len = i2d_PKCS8_PRIV_KEY_INFO(info.get(), &der);
    if (len <= 0 || !der) invalid_key("cannot encode private key (" + openssl_error() + ")");
    std::string content(reinterpret_cast<const char*>(der), static_cast<size_t>(len));
    OPENSSL_clear_free(der, static_cast<size_t>(len));
    write_file_atomic(path, content, fs::perms::owner_read | fs::perms::owner_write);
    OPENSSL_cleanse(content.data(), content.size());
    spdlog::info("Private key written to {}", path.string());
}

void KeyManager::save_public(const PublicKey& key, const fs::path& path) {
    const auto raw = key.raw_bytes();
    write_file_atomic(path, std::string(raw.begin(), raw.end()));
    spdlog::info("Public key written to {}", path.string());
}

KeyPair KeyManager::write_key_pair(const fs::path& private_path, const fs::path& public_path) {
    if (fs::absolute(private_path).lexically_normal() == fs::absolute(public_path).lexically_normal()) {
        throw SealError(ErrorCode::kInvalidArgument, "private and public key paths must differ", private_path);
    }
    KeyPair pair = generate();
    save_private(pair.private_key, private_path);
    save_public(pair.public_key, public_path);
    return pair;
}

}  // namespace modelseal
