#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "signing/artifact_resolver.h"
#include "utils/hash.h"

namespace modelseal {

struct FileDigest {
    std::string relative_path;
    std::vector<uint8_t> digest;
    uint64_t size{0};

    bool operator==(const FileDigest& other) const {
        return relative_path == other.relative_path && digest == other.digest && size == other.size;
    }
    bool operator!=(const FileDigest& other) const { return !(*this == other); }
};

struct DigestOptions {
    HashAlgorithm algorithm{HashAlgorithm::kBlake2b512};
    size_t workers{0};                    // 0 = hardware concurrency
    size_t window_size{64 * 1024 * 1024}; // rounded up to the page size
};

struct DigestResult {
    HashAlgorithm algorithm{HashAlgorithm::kBlake2b512};
    std::vector<FileDigest> files;  // same order as the input file set
    std::vector<uint8_t> root;

    uint64_t total_bytes() const;
};

// Streams every file of an artifact through the hash in bounded windows, in
// parallel, and folds the per-file results into one root digest.
//
// Files are not locked. A file modified while it is being hashed is detected
// by a size change and reported as kPartialHashFailure; an in-place rewrite of
// the same length shows up later as a digest mismatch.
class DigestEngine {
public:
    explicit DigestEngine(DigestOptions options = {});

    // Throws SealError(kPartialHashFailure) if any single file fails; no
    // partial result is returned.
    DigestResult compute(const ArtifactFileSet& set) const;

    FileDigest hash_file(const std::filesystem::path& absolute_path, const std::string& relative_path) const;

    size_t worker_count(size_t file_count) const;
    size_t window_size() const { return window_size_; }
    HashAlgorithm algorithm() const { return options_.algorithm; }

    // Canonical byte encoding of the ordered (path, size, digest) sequence.
    static std::vector<uint8_t> encode_sequence(const std::vector<FileDigest>& files);
    static std::vector<uint8_t> root_digest(HashAlgorithm algorithm, const std::vector<FileDigest>& files);

private:
    DigestOptions options_;
    size_t window_size_;
};

}  // namespace modelseal
