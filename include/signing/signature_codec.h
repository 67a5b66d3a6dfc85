#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "signing/digest_engine.h"
#include "utils/hash.h"

namespace modelseal {

enum class SignatureAlgorithm {
    kEd25519,
};

const char* to_string(SignatureAlgorithm algorithm);
std::optional<SignatureAlgorithm> parse_signature_algorithm(const std::string& name);
size_t signature_size(SignatureAlgorithm algorithm);

constexpr const char* kManifestVersion = "1.0";

struct SignatureManifest {
    std::string version{kManifestVersion};
    std::string signed_at;    // RFC 3339, UTC
    std::string signed_with;  // producer name and version
    HashAlgorithm hash_algorithm{HashAlgorithm::kBlake2b512};
    SignatureAlgorithm signature_algorithm{SignatureAlgorithm::kEd25519};
    std::vector<uint8_t> public_key_fingerprint;
    // Sorted by relative path at creation and never re-sorted.
    std::vector<FileDigest> files;
    std::vector<uint8_t> root_digest;
    std::vector<uint8_t> signature;

    bool operator==(const SignatureManifest& other) const;
    bool operator!=(const SignatureManifest& other) const { return !(*this == other); }
};

// Versioned JSON form of SignatureManifest.
//
// decode() is strict: unknown algorithms throw kUnsupportedAlgorithm; missing
// fields, wrong digest lengths, unsorted or duplicate paths and a root digest
// that does not match the file list throw kMalformedManifest.
class SignatureCodec {
public:
    static std::string encode(const SignatureManifest& manifest);
    static SignatureManifest decode(const std::string& text);

    // Atomic: the target is either the complete new manifest or untouched.
    static void write_file(const SignatureManifest& manifest, const std::filesystem::path& path);
    // I/O failures are reported as kMalformedManifest with the cause attached.
    static SignatureManifest read_file(const std::filesystem::path& path);
};

}  // namespace modelseal
