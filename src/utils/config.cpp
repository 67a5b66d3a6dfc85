#include "utils/config.h"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>

#include "utils/hash.h"

namespace modelseal {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    try {
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring unreadable config file {}: {}", path.string(), e.what());
        return false;
    }
}

bool validExtension(const std::string& ext) {
    return ext.size() > 1 && ext[0] == '.' && ext.find('/') == std::string::npos;
}

}  // namespace

std::filesystem::path defaultConfigPath() {
    if (auto env = getEnvValue("MODELSEAL_CONFIG")) {
        return *env;
    }
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path();
    return home / ".modelseal/config.json";
}

SealConfig loadSealConfig() {
    auto info = loadSealConfigWithLog();
    return info.first;
}

std::pair<SealConfig, std::string> loadSealConfigWithLog() {
    SealConfig cfg;
    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    auto apply_json = [&](const nlohmann::json& j) {
        if (!j.is_object()) return;
        if (j.contains("hash_workers") && j["hash_workers"].is_number_unsigned()) {
            cfg.hash_workers = j["hash_workers"].get<size_t>();
        }
        if (j.contains("window_size") && j["window_size"].is_number_unsigned()) {
            auto v = j["window_size"].get<size_t>();
            if (v >= kMinWindowSize) cfg.window_size = v;
        }
        if (j.contains("hash_algorithm") && j["hash_algorithm"].is_string()) {
            auto v = j["hash_algorithm"].get<std::string>();
            if (parse_hash_algorithm(v)) cfg.hash_algorithm = v;
        }
        if (j.contains("signature_extension") && j["signature_extension"].is_string()) {
            auto v = j["signature_extension"].get<std::string>();
            if (validExtension(v)) cfg.signature_extension = v;
        }
        if (j.contains("sandbox_runtime") && j["sandbox_runtime"].is_string()) {
            cfg.sandbox_runtime = j["sandbox_runtime"].get<std::string>();
        }
        if (j.contains("sandbox_image") && j["sandbox_image"].is_string()) {
            cfg.sandbox_image = j["sandbox_image"].get<std::string>();
        }
    };

    const auto cfg_path = defaultConfigPath();
    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            apply_json(j);
            used_file = true;
            log << "file=" << cfg_path.string() << " ";
        }
    }

    if (auto env = getEnvValue("MODELSEAL_HASH_WORKERS")) {
        try {
            long long v = std::stoll(*env);
            if (v >= 0 && v <= 256) cfg.hash_workers = static_cast<size_t>(v);
            log << "env:HASH_WORKERS=" << v << " ";
            used_env = true;
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid MODELSEAL_HASH_WORKERS='{}'", *env);
        }
    }

    if (auto env = getEnvValue("MODELSEAL_WINDOW_SIZE")) {
        try {
            long long v = std::stoll(*env);
            if (v >= static_cast<long long>(kMinWindowSize)) cfg.window_size = static_cast<size_t>(v);
            log << "env:WINDOW_SIZE=" << v << " ";
            used_env = true;
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid MODELSEAL_WINDOW_SIZE='{}'", *env);
        }
    }

    if (auto env = getEnvValue("MODELSEAL_HASH_ALGORITHM")) {
        if (parse_hash_algorithm(*env)) {
            cfg.hash_algorithm = *env;
            log << "env:HASH_ALGORITHM=" << *env << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring unknown MODELSEAL_HASH_ALGORITHM='{}'", *env);
        }
    }

    if (auto env = getEnvValue("MODELSEAL_SIGNATURE_EXT")) {
        if (validExtension(*env)) {
            cfg.signature_extension = *env;
            log << "env:SIGNATURE_EXT=" << *env << " ";
            used_env = true;
        }
    }

    if (auto env = getEnvValue("MODELSEAL_SANDBOX_RUNTIME")) {
        if (!env->empty()) {
            cfg.sandbox_runtime = *env;
            log << "env:SANDBOX_RUNTIME=" << *env << " ";
            used_env = true;
        }
    }

    if (auto env = getEnvValue("MODELSEAL_SANDBOX_IMAGE")) {
        if (!env->empty()) {
            cfg.sandbox_image = *env;
            log << "env:SANDBOX_IMAGE=" << *env << " ";
            used_env = true;
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

}  // namespace modelseal
