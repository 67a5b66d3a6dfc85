#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "model/format_adapter.h"

namespace modelseal {

class AdapterRegistry;

struct ArtifactFile {
    std::filesystem::path absolute_path;
    // Generic ('/') form relative to ArtifactFileSet::root; the sort key.
    std::string relative_path;
};

struct ArtifactFileSet {
    std::filesystem::path root;
    std::vector<ArtifactFile> files;
    // Only filled in lenient mode: references that did not exist.
    std::vector<std::string> missing;

    std::vector<std::string> relative_paths() const;
};

enum class ResolveMode {
    kStrict,   // missing references throw kMissingReference
    kLenient,  // missing references are recorded in ArtifactFileSet::missing
};

struct ResolveOptions {
    ResolveMode mode{ResolveMode::kStrict};
    std::optional<ModelFormat> forced_format;
    // Files with this extension are signature artifacts and never part of
    // an artifact, in any resolution mode.
    std::string signature_extension{".signature"};
    // Additional absolute paths to leave out (e.g. an explicit signature path).
    std::vector<std::filesystem::path> excluded;
};

// Turns a starting path into the sorted, deduplicated list of files that make
// up the artifact:
//  - a directory: every regular file below it (symlinks followed, cycles rejected)
//  - a file whose adapter reports backing files: the file plus those files
//  - any other file: the file itself
// Unreadable files, broken links and link cycles throw kUnresolvableArtifact.
class ArtifactResolver {
public:
    explicit ArtifactResolver(const AdapterRegistry* adapters = nullptr);

    ArtifactFileSet resolve(const std::filesystem::path& start, const ResolveOptions& options = {}) const;

private:
    const AdapterRegistry* adapters_;
};

}  // namespace modelseal
