#pragma once

#include "model/format_adapter.h"

namespace modelseal {

// Single self-contained .safetensors file. Only the header is read.
class SafeTensorsAdapter : public FormatAdapter {
public:
    ModelFormat format() const override { return ModelFormat::SafeTensors; }
    bool accepts(const std::filesystem::path& path, Scope scope) const override;
    CanonicalModel decode(const std::filesystem::path& path) const override;
};

// *.safetensors.index.json: weight_map values name the shard files.
class SafeTensorsIndexAdapter : public FormatAdapter {
public:
    ModelFormat format() const override { return ModelFormat::SafeTensors; }
    bool accepts(const std::filesystem::path& path, Scope scope) const override;
    CanonicalModel decode(const std::filesystem::path& path) const override;
    std::vector<std::filesystem::path> backing_files(const std::filesystem::path& path) const override;
};

bool is_safetensors_index_file(const std::filesystem::path& path);

}  // namespace modelseal
