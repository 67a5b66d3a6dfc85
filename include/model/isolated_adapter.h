#pragma once

#include <functional>
#include <string>
#include <vector>

#include "model/format_adapter.h"

namespace modelseal {

struct SealConfig;

struct SandboxSettings {
    std::string runtime{"docker"};
    std::string image{"modelseal-inspect:latest"};

    static SandboxSettings from_config(const SealConfig& config);
};

// Runs argv without a shell; stdout is captured into `output`.
// Returns the exit status, 128+signal, or -1 if the process could not start.
using ProcessRunner = std::function<int(const std::vector<std::string>& argv, std::string& output)>;

int run_process(const std::vector<std::string>& argv, std::string& output);

// PyTorch pickles can execute code on load, so they are never opened in this
// process. A container with networking disabled and the model mounted
// read-only prints a serialized CanonicalModel on stdout.
class IsolatedPyTorchAdapter : public FormatAdapter {
public:
    explicit IsolatedPyTorchAdapter(SandboxSettings settings, ProcessRunner runner = run_process);

    ModelFormat format() const override { return ModelFormat::PyTorch; }
    bool accepts(const std::filesystem::path& path, Scope scope) const override;
    CanonicalModel decode(const std::filesystem::path& path) const override;

    std::vector<std::string> sandbox_command(const std::filesystem::path& absolute_path) const;

private:
    SandboxSettings settings_;
    ProcessRunner runner_;
};

}  // namespace modelseal
