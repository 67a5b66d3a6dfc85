#include "signing/model_signer.h"

#include <chrono>
#include <ctime>
#include <spdlog/spdlog.h>

#include "model/adapter_registry.h"
#include "signing/artifact_resolver.h"
#include "signing/digest_engine.h"
#include "utils/version.h"

namespace fs = std::filesystem;

namespace modelseal {

namespace {

fs::path strip_trailing_separator(const fs::path& path) {
    fs::path abs = fs::absolute(path).lexically_normal();
    if (abs.filename().empty() && abs.has_parent_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

}  // namespace

const char* to_string(MismatchReason reason) {
    switch (reason) {
        case MismatchReason::kMissingFile:
            return "missing-file";
        case MismatchReason::kExtraFile:
            return "extra-file";
        case MismatchReason::kLengthMismatch:
            return "length-mismatch";
        case MismatchReason::kDigestMismatch:
            return "digest-mismatch";
    }
    return "unknown";
}

const char* to_string(SignatureCheck check) {
    switch (check) {
        case SignatureCheck::kNotChecked:
            return "not-checked";
        case SignatureCheck::kValid:
            return "valid";
        case SignatureCheck::kInvalid:
            return "invalid";
        case SignatureCheck::kWrongKey:
            return "wrong-key";
    }
    return "unknown";
}

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        return "1970-01-01T00:00:00Z";
    }
    return buf;
}

ModelSigner::ModelSigner(const AdapterRegistry& adapters, SealConfig config)
    : adapters_(adapters), config_(std::move(config)) {}

HashAlgorithm ModelSigner::hash_algorithm() const {
    auto algorithm = parse_hash_algorithm(config_.hash_algorithm);
    if (!algorithm) {
        throw SealError(ErrorCode::kUnsupportedAlgorithm,
                        "unsupported hash algorithm '" + config_.hash_algorithm + "'");
    }
    return *algorithm;
}

DigestOptions ModelSigner::digest_options(HashAlgorithm algorithm) const {
    DigestOptions options;
    options.algorithm = algorithm;
    options.workers = config_.hash_workers;
    options.window_size = config_.window_size;
    return options;
}

fs::path ModelSigner::default_signature_path(const fs::path& artifact) const {
    const fs::path abs = strip_trailing_separator(artifact);
    return abs.parent_path() / (abs.filename().string() + config_.signature_extension);
}

SignatureManifest ModelSigner::sign(const fs::path& artifact, const PrivateKey& key, const SignOptions& options) const {
    const fs::path signature_path =
        options.signature_path.empty() ? default_signature_path(artifact) : fs::absolute(options.signature_path);
    const HashAlgorithm algorithm = hash_algorithm();

    ResolveOptions resolve_options;
    resolve_options.mode = ResolveMode::kStrict;
    resolve_options.forced_format = options.forced_format;
    resolve_options.signature_extension = config_.signature_extension;
    resolve_options.excluded.push_back(signature_path);

    ArtifactResolver resolver(&adapters_);
    const ArtifactFileSet files = resolver.resolve(artifact, resolve_options);
    if (files.files.empty()) {
        throw SealError(ErrorCode::kUnresolvableArtifact, "artifact contains no files", artifact);
    }

    DigestEngine engine(digest_options(algorithm));
    DigestResult digests = engine.compute(files);

    SignatureManifest manifest;
    manifest.signed_at = utc_timestamp();
    manifest.signed_with = std::string("modelseal v") + MODELSEAL_VERSION;
    manifest.hash_algorithm = algorithm;
    manifest.signature_algorithm = SignatureAlgorithm::kEd25519;
    manifest.public_key_fingerprint = key.public_key().fingerprint(algorithm);
    manifest.files = std::move(digests.files);
    manifest.root_digest = std::move(digests.root);
    manifest.signature = key.sign(manifest.root_digest);

    SignatureCodec::write_file(manifest, signature_path);
    spdlog::info("Signed {} file(s) under {} -> {}", manifest.files.size(), files.root.string(),
                 signature_path.string());
    return manifest;
}

std::vector<ContentMismatch> ModelSigner::compare(const std::vector<FileDigest>& recorded,
                                                  const std::vector<FileDigest>& observed) {
    std::vector<ContentMismatch> out;
    size_t i = 0;
    size_t j = 0;
    while (i < recorded.size() || j < observed.size()) {
        if (j == observed.size() ||
            (i < recorded.size() && recorded[i].relative_path < observed[j].relative_path)) {
            out.push_back({recorded[i].relative_path, MismatchReason::kMissingFile});
            ++i;
        } else if (i == recorded.size() || observed[j].relative_path < recorded[i].relative_path) {
            out.push_back({observed[j].relative_path, MismatchReason::kExtraFile});
            ++j;
        } else {
            if (recorded[i].size != observed[j].size) {
                out.push_back({recorded[i].relative_path, MismatchReason::kLengthMismatch});
            } else if (recorded[i].digest != observed[j].digest) {
                out.push_back({recorded[i].relative_path, MismatchReason::kDigestMismatch});
            }
            ++i;
            ++j;
        }
    }
    return out;
}

VerificationResult ModelSigner::verify(const fs::path& artifact, const PublicKey& key,
                                       const VerifyOptions& options) const {
    VerificationResult result;
    result.signature_path =
        options.signature_path.empty() ? default_signature_path(artifact) : fs::absolute(options.signature_path);

    try {
        result.manifest = SignatureCodec::read_file(result.signature_path);
    } catch (const SealError& e) {
        spdlog::debug("Cannot load signature {}: {}", result.signature_path.string(), e.what());
        result.failure = VerificationFailure{e.code(), e.what()};
        return result;
    }
    const SignatureManifest& manifest = *result.manifest;

    std::vector<FileDigest> observed;
    try {
        ResolveOptions resolve_options;
        resolve_options.mode = ResolveMode::kLenient;
        resolve_options.forced_format = options.forced_format;
        resolve_options.signature_extension = config_.signature_extension;
        resolve_options.excluded.push_back(result.signature_path);

        ArtifactResolver resolver(&adapters_);
        const ArtifactFileSet files = resolver.resolve(artifact, resolve_options);
        for (const auto& missing : files.missing) {
            spdlog::debug("Referenced file is missing: {}", missing);
        }
        if (!files.files.empty()) {
            DigestEngine engine(digest_options(manifest.hash_algorithm));
            observed = engine.compute(files).files;
        }
    } catch (const SealError& e) {
        result.failure = VerificationFailure{e.code(), e.what()};
        return result;
    } catch (const std::exception& e) {
        result.failure = VerificationFailure{ErrorCode::kIoError, e.what()};
        return result;
    }

    result.mismatches = compare(manifest.files, observed);

    try {
        const auto fresh_root = DigestEngine::root_digest(manifest.hash_algorithm, observed);
        bool valid = key.verify(fresh_root, manifest.signature);
        if (!valid && !result.mismatches.empty()) {
            // The content changed; the signature may still be genuine for
            // what was recorded.
            valid = key.verify(manifest.root_digest, manifest.signature);
        }
        if (valid) {
            result.signature = SignatureCheck::kValid;
        } else if (key.fingerprint(manifest.hash_algorithm) != manifest.public_key_fingerprint) {
            result.signature = SignatureCheck::kWrongKey;
        } else {
            result.signature = SignatureCheck::kInvalid;
        }
    } catch (const SealError& e) {
        result.failure = VerificationFailure{e.code(), e.what()};
        return result;
    }

    spdlog::info("Verified {} against {}: {} mismatch(es), signature {}", artifact.string(),
                 result.signature_path.string(), result.mismatches.size(), to_string(result.signature));
    return result;
}

}  // namespace modelseal
