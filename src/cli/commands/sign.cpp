// sign command: hashes an artifact and writes its signature manifest

#include "cli/commands.h"
#include "core/seal_error.h"
#include "model/adapter_registry.h"
#include "signing/key_manager.h"
#include "signing/model_signer.h"
#include "utils/config.h"
#include "utils/hex.h"
#include <exception>
#include <iostream>
#include <spdlog/spdlog.h>

namespace modelseal {
namespace cli {
namespace commands {

int sign(const SignCommandOptions& options) {
    SignOptions sign_options;
    if (!parseFormatOption(options.format, sign_options.forced_format)) {
        std::cerr << "Error: unknown format '" << options.format << "'" << std::endl;
        return kExitUsage;
    }
    sign_options.signature_path = options.output;

    try {
        const auto [config, config_log] = loadSealConfigWithLog();
        spdlog::debug("config: {}", config_log);
        const auto registry = AdapterRegistry::with_defaults(config);
        const PrivateKey key = KeyManager::load_private(options.key);

        ModelSigner signer(registry, config);
        const std::filesystem::path output =
            options.output.empty() ? signer.default_signature_path(options.path) : std::filesystem::path(options.output);
        const SignatureManifest manifest = signer.sign(options.path, key, sign_options);

        uint64_t total = 0;
        for (const auto& f : manifest.files) {
            std::cout << "  " << f.relative_path << "  " << f.size << " bytes" << std::endl;
            total += f.size;
        }
        std::cout << "Signed " << manifest.files.size() << " file(s), " << total << " bytes" << std::endl;
        std::cout << "Root digest (" << to_string(manifest.hash_algorithm) << "): " << to_hex(manifest.root_digest)
                  << std::endl;
        std::cout << "Signature written to " << output.string() << std::endl;
        return kExitOk;
    } catch (const SealError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

}  // namespace commands
}  // namespace cli
}  // namespace modelseal
