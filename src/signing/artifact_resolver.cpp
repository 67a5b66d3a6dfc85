#include "signing/artifact_resolver.h"

#include <algorithm>
#include <set>
#include <unistd.h>
#include <spdlog/spdlog.h>

#include "core/seal_error.h"
#include "model/adapter_registry.h"
#include "utils/utf8.h"

namespace fs = std::filesystem;

namespace modelseal {

namespace {

fs::path normalize_start(const fs::path& start) {
    fs::path abs = fs::absolute(start).lexically_normal();
    if (abs.filename().empty() && abs.has_parent_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

class Collector {
public:
    Collector(const ResolveOptions& options, ArtifactFileSet& out) : options_(options), out_(out) {
        for (const auto& p : options.excluded) {
            std::error_code ec;
            auto canon = fs::weakly_canonical(fs::absolute(p), ec);
            excluded_.insert(ec ? fs::absolute(p).lexically_normal() : canon);
        }
    }

    bool is_excluded(const fs::path& path) const {
        if (!options_.signature_extension.empty() && path.extension() == options_.signature_extension) {
            return true;
        }
        if (excluded_.empty()) return false;
        std::error_code ec;
        auto canon = fs::weakly_canonical(path, ec);
        return excluded_.count(ec ? path : canon) > 0;
    }

    void add_file(const fs::path& absolute_path, const std::string& relative_path) {
        if (::access(absolute_path.c_str(), R_OK) != 0) {
            throw SealError(ErrorCode::kUnresolvableArtifact, "file is not readable", absolute_path);
        }
        // Manifest paths are JSON strings.
        if (!is_valid_utf8(relative_path)) {
            throw SealError(ErrorCode::kUnresolvableArtifact, "file name is not valid UTF-8", absolute_path);
        }
        out_.files.push_back({absolute_path, relative_path});
    }

    // ancestors holds the canonical paths of the directories above `dir`.
    void walk(const fs::path& dir, const fs::path& relative_dir, std::vector<fs::path>& ancestors) {
        std::error_code ec;
        const fs::path canon = fs::canonical(dir, ec);
        if (ec) {
            throw SealError(ErrorCode::kUnresolvableArtifact, "cannot resolve directory (" + ec.message() + ")", dir);
        }
        if (std::find(ancestors.begin(), ancestors.end(), canon) != ancestors.end()) {
            throw SealError(ErrorCode::kUnresolvableArtifact, "symbolic link cycle", dir);
        }
        ancestors.push_back(canon);

        std::vector<fs::path> entries;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            throw SealError(ErrorCode::kUnresolvableArtifact, "cannot list directory (" + ec.message() + ")", dir);
        }
        for (const fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            entries.push_back(it->path());
        }
        if (ec) {
            throw SealError(ErrorCode::kUnresolvableArtifact, "cannot list directory (" + ec.message() + ")", dir);
        }

        for (const auto& entry : entries) {
            const fs::path relative = relative_dir / entry.filename();
            const auto st = fs::status(entry, ec);
            if (ec || st.type() == fs::file_type::not_found) {
                throw SealError(ErrorCode::kUnresolvableArtifact, "broken symbolic link or unreadable entry", entry);
            }
            if (st.type() == fs::file_type::directory) {
                walk(entry, relative, ancestors);
            } else if (st.type() == fs::file_type::regular) {
                if (is_excluded(entry)) {
                    spdlog::debug("Skipping signature artifact {}", entry.string());
                    continue;
                }
                add_file(entry, relative.generic_string());
            } else {
                spdlog::debug("Skipping non-regular file {}", entry.string());
            }
        }
        ancestors.pop_back();
    }

private:
    const ResolveOptions& options_;
    ArtifactFileSet& out_;
    std::set<fs::path> excluded_;
};

bool escapes_root(const fs::path& reference) {
    if (reference.is_absolute() || reference.has_root_name()) return true;
    const fs::path normal = reference.lexically_normal();
    return normal.empty() || *normal.begin() == "..";
}

}  // namespace

std::vector<std::string> ArtifactFileSet::relative_paths() const {
    std::vector<std::string> out;
    out.reserve(files.size());
    for (const auto& f : files) out.push_back(f.relative_path);
    return out;
}

ArtifactResolver::ArtifactResolver(const AdapterRegistry* adapters) : adapters_(adapters) {}

ArtifactFileSet ArtifactResolver::resolve(const fs::path& start, const ResolveOptions& options) const {
    const fs::path path = normalize_start(start);
    ArtifactFileSet set;
    Collector collector(options, set);

    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        if (options.mode == ResolveMode::kLenient) {
            set.root = path.parent_path();
            return set;
        }
        throw SealError(ErrorCode::kUnresolvableArtifact, "artifact not found", path);
    }
    if (ec) {
        throw SealError(ErrorCode::kUnresolvableArtifact, "cannot stat artifact (" + ec.message() + ")", path);
    }

    if (st.type() == fs::file_type::directory) {
        set.root = path;
        std::vector<fs::path> ancestors;
        collector.walk(path, fs::path(), ancestors);
    } else if (st.type() == fs::file_type::regular) {
        set.root = path.parent_path();
        if (collector.is_excluded(path)) {
            throw SealError(ErrorCode::kUnresolvableArtifact, "path is a signature artifact", path);
        }
        collector.add_file(path, path.filename().generic_string());

        const FormatAdapter* adapter =
            adapters_ ? adapters_->find(path, Scope::Signing, options.forced_format) : nullptr;
        if (!adapter) {
            spdlog::warn("Unrecognized file format for {}; only this file will be covered", path.string());
        } else {
            for (const auto& reference : adapter->backing_files(path)) {
                if (escapes_root(reference)) {
                    throw SealError(ErrorCode::kUnresolvableArtifact,
                                    "reference '" + reference.string() + "' escapes the artifact directory", path);
                }
                const fs::path relative = reference.lexically_normal();
                const fs::path target = set.root / relative;
                const auto ref_status = fs::status(target, ec);
                if (ref_status.type() == fs::file_type::not_found) {
                    if (options.mode == ResolveMode::kLenient) {
                        set.missing.push_back(relative.generic_string());
                        continue;
                    }
                    throw SealError(ErrorCode::kMissingReference, "referenced file does not exist", target);
                }
                if (ec || ref_status.type() != fs::file_type::regular) {
                    throw SealError(ErrorCode::kUnresolvableArtifact, "referenced path is not a regular file", target);
                }
                if (collector.is_excluded(target)) {
                    throw SealError(ErrorCode::kUnresolvableArtifact,
                                    "reference '" + reference.string() + "' names a signature artifact", path);
                }
                collector.add_file(target, relative.generic_string());
            }
        }
    } else {
        throw SealError(ErrorCode::kUnresolvableArtifact, "not a regular file or directory", path);
    }

    std::sort(set.files.begin(), set.files.end(), [](const ArtifactFile& a, const ArtifactFile& b) {
        return a.relative_path < b.relative_path;
    });
    set.files.erase(std::unique(set.files.begin(), set.files.end(),
                                [](const ArtifactFile& a, const ArtifactFile& b) {
                                    return a.relative_path == b.relative_path;
                                }),
                    set.files.end());
    std::sort(set.missing.begin(), set.missing.end());
    set.missing.erase(std::unique(set.missing.begin(), set.missing.end()), set.missing.end());

    spdlog::debug("Resolved {} file(s) under {}", set.files.size(), set.root.string());
    return set;
}

}  // namespace modelseal
