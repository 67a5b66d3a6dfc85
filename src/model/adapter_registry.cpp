#include "model/adapter_registry.h"

#include <spdlog/spdlog.h>

#include "core/seal_error.h"
#include "model/gguf_adapter.h"
#include "model/isolated_adapter.h"
#include "model/safetensors_adapter.h"
#include "utils/config.h"

namespace modelseal {

AdapterRegistry AdapterRegistry::with_defaults(const SealConfig& config) {
    AdapterRegistry registry;
    registry.add(std::make_unique<SafeTensorsAdapter>());
    registry.add(std::make_unique<SafeTensorsIndexAdapter>());
    registry.add(std::make_unique<GgufAdapter>());
    registry.add(std::make_unique<IsolatedPyTorchAdapter>(SandboxSettings::from_config(config)));
    return registry;
}

void AdapterRegistry::add(std::unique_ptr<FormatAdapter> adapter) {
    if (adapter) adapters_.push_back(std::move(adapter));
}

const FormatAdapter* AdapterRegistry::find(const std::filesystem::path& path,
                                           Scope scope,
                                           std::optional<ModelFormat> forced) const {
    if (forced) {
        const FormatAdapter* fallback = nullptr;
        for (const auto& adapter : adapters_) {
            if (adapter->format() != *forced) continue;
            if (adapter->accepts(path, scope)) return adapter.get();
            if (!fallback) fallback = adapter.get();
        }
        return fallback;
    }
    for (const auto& adapter : adapters_) {
        if (adapter->accepts(path, scope)) return adapter.get();
    }
    return nullptr;
}

CanonicalModel AdapterRegistry::decode(const std::filesystem::path& path,
                                       std::optional<ModelFormat> forced) const {
    const FormatAdapter* adapter = find(path, Scope::Inspection, forced);
    if (!adapter) {
        if (forced) {
            throw SealError(ErrorCode::kDecodeError,
                            std::string("no decoder registered for format ") + to_string(*forced), path);
        }
        throw SealError(ErrorCode::kDecodeError, "unsupported file format", path);
    }
    spdlog::debug("Decoding {} as {}", path.string(), to_string(adapter->format()));
    return adapter->decode(path);
}

}  // namespace modelseal
