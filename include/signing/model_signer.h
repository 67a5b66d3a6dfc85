#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/seal_error.h"
#include "model/canonical_model.h"
#include "signing/key_manager.h"
#include "signing/signature_codec.h"
#include "utils/config.h"

namespace modelseal {

class AdapterRegistry;

enum class MismatchReason {
    kMissingFile,     // recorded in the manifest, absent now
    kExtraFile,       // present now, not recorded
    kLengthMismatch,
    kDigestMismatch,  // same length, different content
};

const char* to_string(MismatchReason reason);

struct ContentMismatch {
    std::string path;
    MismatchReason reason;

    bool operator==(const ContentMismatch& other) const {
        return path == other.path && reason == other.reason;
    }
};

enum class SignatureCheck {
    kNotChecked,
    kValid,
    kInvalid,
    kWrongKey,
};

const char* to_string(SignatureCheck check);

struct VerificationFailure {
    ErrorCode code;
    std::string message;
};

struct VerificationResult {
    std::filesystem::path signature_path;
    std::optional<SignatureManifest> manifest;
    // Ordered by path.
    std::vector<ContentMismatch> mismatches;
    SignatureCheck signature{SignatureCheck::kNotChecked};
    std::optional<VerificationFailure> failure;

    bool ok() const {
        return !failure && mismatches.empty() && signature == SignatureCheck::kValid;
    }
    bool signature_invalid() const {
        return signature == SignatureCheck::kInvalid || signature == SignatureCheck::kWrongKey;
    }
};

struct SignOptions {
    // Empty: default_signature_path(artifact).
    std::filesystem::path signature_path;
    std::optional<ModelFormat> forced_format;
};

struct VerifyOptions {
    std::filesystem::path signature_path;
    std::optional<ModelFormat> forced_format;
};

// Composes resolver, digest engine, key manager and codec into sign and verify.
// Instances hold no mutable state; concurrent calls on different artifacts are
// safe. Concurrent sign and verify of the same artifact are not coordinated.
class ModelSigner {
public:
    ModelSigner(const AdapterRegistry& adapters, SealConfig config);

    // Throws SealError. On failure no signature file is created or replaced.
    SignatureManifest sign(const std::filesystem::path& artifact,
                           const PrivateKey& key,
                           const SignOptions& options = {}) const;

    // Never throws for artifact, manifest or I/O problems; they are reported
    // through VerificationResult::failure and mismatches.
    VerificationResult verify(const std::filesystem::path& artifact,
                              const PublicKey& key,
                              const VerifyOptions& options = {}) const;

    std::filesystem::path default_signature_path(const std::filesystem::path& artifact) const;

    // Element-wise comparison of two sorted digest sequences.
    static std::vector<ContentMismatch> compare(const std::vector<FileDigest>& recorded,
                                                const std::vector<FileDigest>& observed);

private:
    HashAlgorithm hash_algorithm() const;
    DigestOptions digest_options(HashAlgorithm algorithm) const;

    const AdapterRegistry& adapters_;
    SealConfig config_;
};

// RFC 3339 UTC timestamp with second precision, e.g. 2024-05-01T12:00:00Z.
std::string utc_timestamp();

}  // namespace modelseal
