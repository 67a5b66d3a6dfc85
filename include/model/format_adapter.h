#pragma once

#include <filesystem>
#include <vector>

#include "model/canonical_model.h"

namespace modelseal {

enum class Scope {
    Inspection,
    Signing,
};

// One implementation per container format. decode() throws
// SealError(kDecodeError) for malformed input.
class FormatAdapter {
public:
    virtual ~FormatAdapter() = default;

    virtual ModelFormat format() const = 0;
    virtual bool accepts(const std::filesystem::path& path, Scope scope) const = 0;
    virtual CanonicalModel decode(const std::filesystem::path& path) const = 0;

    // Files holding data for `path` that are not stored inline, relative to
    // path's directory. Used by the artifact resolver; must not require a
    // full decode of tensor data.
    virtual std::vector<std::filesystem::path> backing_files(const std::filesystem::path& path) const {
        (void)path;
        return {};
    }
};

}  // namespace modelseal
