#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

namespace modelseal {

struct SealConfig {
    size_t hash_workers{0};                   // 0 = hardware concurrency
    size_t window_size{64 * 1024 * 1024};     // bytes per read window
    std::string hash_algorithm{"BLAKE2b512"};
    std::string signature_extension{".signature"};
    std::string sandbox_runtime{"docker"};
    std::string sandbox_image{"modelseal-inspect:latest"};
};

constexpr size_t kMinWindowSize = 4096;

// Config file: MODELSEAL_CONFIG or ~/.modelseal/config.json.
std::filesystem::path defaultConfigPath();

SealConfig loadSealConfig();
std::pair<SealConfig, std::string> loadSealConfigWithLog();

}  // namespace modelseal
