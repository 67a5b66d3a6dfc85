#pragma once

#include "model/format_adapter.h"

namespace modelseal {

// GGUF v2/v3 header decoder: key/value metadata and tensor infos.
// Tensor data is never read.
class GgufAdapter : public FormatAdapter {
public:
    ModelFormat format() const override { return ModelFormat::Gguf; }
    bool accepts(const std::filesystem::path& path, Scope scope) const override;
    CanonicalModel decode(const std::filesystem::path& path) const override;
};

}  // namespace modelseal
