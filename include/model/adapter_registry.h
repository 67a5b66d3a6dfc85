#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "model/format_adapter.h"

namespace modelseal {

struct SealConfig;

class AdapterRegistry {
public:
    AdapterRegistry() = default;

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;
    AdapterRegistry(AdapterRegistry&&) = default;
    AdapterRegistry& operator=(AdapterRegistry&&) = default;

    // SafeTensors, SafeTensors index, GGUF and the sandboxed PyTorch inspector.
    static AdapterRegistry with_defaults(const SealConfig& config);

    void add(std::unique_ptr<FormatAdapter> adapter);

    // With a forced format, an adapter of that format that accepts the path is
    // preferred, then the first adapter of that format. Without one, the first
    // adapter accepting the path.
    const FormatAdapter* find(const std::filesystem::path& path,
                              Scope scope,
                              std::optional<ModelFormat> forced = std::nullopt) const;

    // Throws SealError(kDecodeError) when no adapter applies.
    CanonicalModel decode(const std::filesystem::path& path,
                          std::optional<ModelFormat> forced = std::nullopt) const;

    size_t size() const { return adapters_.size(); }

private:
    std::vector<std::unique_ptr<FormatAdapter>> adapters_;
};

}  // namespace modelseal
