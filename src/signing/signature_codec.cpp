#include "signing/signature_codec.h"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/seal_error.h"
#include "utils/atomic_file.h"
#include "utils/hex.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace modelseal {

namespace {

constexpr size_t MAX_MANIFEST_SIZE = 64 * 1024 * 1024;

[[noreturn]] void malformed(const std::string& message) {
    throw SealError(ErrorCode::kMalformedManifest, "malformed signature manifest: " + message);
}

const json& require(const json& j, const char* key, json::value_t type) {
    if (!j.contains(key)) malformed(std::string("missing '") + key + "'");
    const json& v = j.at(key);
    if (type == json::value_t::number_unsigned) {
        if (!v.is_number_unsigned()) malformed(std::string("'") + key + "' must be a non-negative integer");
    } else if (v.type() != type) {
        malformed(std::string("'") + key + "' has the wrong type");
    }
    return v;
}

std::vector<uint8_t> require_hex(const json& j, const char* key, size_t expected_size) {
    const auto& text = require(j, key, json::value_t::string).get_ref<const std::string&>();
    auto bytes = from_hex(text);
    if (!bytes) malformed(std::string("'") + key + "' is not valid hex");
    if (bytes->size() != expected_size) {
        malformed(std::string("'") + key + "' has length " + std::to_string(bytes->size()) + ", expected " +
                  std::to_string(expected_size));
    }
    return *bytes;
}

bool escapes_root(const std::string& relative) {
    const fs::path p(relative);
    if (p.is_absolute() || p.has_root_name()) return true;
    for (const auto& part : p) {
        if (part == "..") return true;
    }
    return false;
}

}  // namespace

const char* to_string(SignatureAlgorithm algorithm) {
    switch (algorithm) {
        case SignatureAlgorithm::kEd25519:
            return "Ed25519";
    }
    return "UNKNOWN";
}

std::optional<SignatureAlgorithm> parse_signature_algorithm(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "ed25519") return SignatureAlgorithm::kEd25519;
    return std::nullopt;
}

size_t signature_size(SignatureAlgorithm algorithm) {
    switch (algorithm) {
        case SignatureAlgorithm::kEd25519:
            return 64;
    }
    return 0;
}

bool SignatureManifest::operator==(const SignatureManifest& other) const {
    return version == other.version && signed_at == other.signed_at && signed_with == other.signed_with &&
           hash_algorithm == other.hash_algorithm && signature_algorithm == other.signature_algorithm &&
           public_key_fingerprint == other.public_key_fingerprint && files == other.files &&
           root_digest == other.root_digest && signature == other.signature;
}

std::string SignatureCodec::encode(const SignatureManifest& manifest) {
    json files = json::array();
    for (const auto& f : manifest.files) {
        files.push_back({{"path", f.relative_path}, {"digest", to_hex(f.digest)}, {"size", f.size}});
    }
    json j = {
        {"version", manifest.version},
        {"signed_at", manifest.signed_at},
        {"signed_with", manifest.signed_with},
        {"algorithms",
         {{"hash", to_string(manifest.hash_algorithm)}, {"signature", to_string(manifest.signature_algorithm)}}},
        {"public_key", to_hex(manifest.public_key_fingerprint)},
        {"files", files},
        {"root_digest", to_hex(manifest.root_digest)},
        {"signature", to_hex(manifest.signature)},
    };
    try {
        return j.dump(2) + "\n";
    } catch (const json::exception& e) {
        throw SealError(ErrorCode::kMalformedManifest, std::string("cannot encode manifest (") + e.what() + ")");
    }
}

SignatureManifest SignatureCodec::decode(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        malformed(std::string("invalid JSON (") + e.what() + ")");
    }
    if (!j.is_object()) malformed("expected a JSON object");

    SignatureManifest m;
    m.version = require(j, "version", json::value_t::string).get<std::string>();
    if (m.version != kManifestVersion) malformed("unsupported version '" + m.version + "'");

    // Algorithms first: every length check below depends on them.
    const auto& algorithms = require(j, "algorithms", json::value_t::object);
    const auto hash_name = require(algorithms, "hash", json::value_t::string).get<std::string>();
    const auto sig_name = require(algorithms, "signature", json::value_t::string).get<std::string>();
    auto hash = parse_hash_algorithm(hash_name);
    if (!hash) throw SealError(ErrorCode::kUnsupportedAlgorithm, "unsupported hash algorithm '" + hash_name + "'");
    auto sig = parse_signature_algorithm(sig_name);
    if (!sig) {
        throw SealError(ErrorCode::kUnsupportedAlgorithm, "unsupported signature algorithm '" + sig_name + "'");
    }
    m.hash_algorithm = *hash;
    m.signature_algorithm = *sig;
    const size_t dsize = digest_size(m.hash_algorithm);

    m.signed_at = require(j, "signed_at", json::value_t::string).get<std::string>();
    if (m.signed_at.empty()) malformed("'signed_at' is empty");
    if (j.contains("signed_with")) {
        if (!j["signed_with"].is_string()) malformed("'signed_with' has the wrong type");
        m.signed_with = j["signed_with"].get<std::string>();
    }
    m.public_key_fingerprint = require_hex(j, "public_key", dsize);

    const auto& files = require(j, "files", json::value_t::array);
    for (const auto& entry : files) {
        if (!entry.is_object()) malformed("file entry is not an object");
        FileDigest f;
        f.relative_path = require(entry, "path", json::value_t::string).get<std::string>();
        if (f.relative_path.empty()) malformed("file entry has an empty path");
        if (escapes_root(f.relative_path)) malformed("file path '" + f.relative_path + "' escapes the artifact root");
        f.digest = require_hex(entry, "digest", dsize);
        f.size = require(entry, "size", json::value_t::number_unsigned).get<uint64_t>();
        if (!m.files.empty() && !(m.files.back().relative_path < f.relative_path)) {
            malformed("file paths are not strictly sorted at '" + f.relative_path + "'");
        }
        m.files.push_back(std::move(f));
    }

    m.root_digest = require_hex(j, "root_digest", dsize);
    if (DigestEngine::root_digest(m.hash_algorithm, m.files) != m.root_digest) {
        malformed("root digest does not match the file list");
    }
    m.signature = require_hex(j, "signature", signature_size(m.signature_algorithm));
    return m;
}

void SignatureCodec::write_file(const SignatureManifest& manifest, const fs::path& path) {
    write_file_atomic(path, encode(manifest));
    spdlog::debug("Signature manifest written to {}", path.string());
}

SignatureManifest SignatureCodec::read_file(const fs::path& path) {
    std::string text;
    try {
        text = read_file_bytes(path, MAX_MANIFEST_SIZE);
    } catch (const SealError& e) {
        throw SealError(ErrorCode::kMalformedManifest, std::string("cannot read signature manifest: ") + e.what());
    }
    return decode(text);
}

}  // namespace modelseal
