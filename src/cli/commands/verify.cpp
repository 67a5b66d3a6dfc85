// verify command: checks an artifact against its signature manifest

#include "cli/commands.h"
#include "core/seal_error.h"
#include "model/adapter_registry.h"
#include "signing/key_manager.h"
#include "signing/model_signer.h"
#include "utils/config.h"
#include <exception>
#include <iostream>
#include <spdlog/spdlog.h>

namespace modelseal {
namespace cli {
namespace commands {

int verify(const VerifyCommandOptions& options) {
    VerifyOptions verify_options;
    if (!parseFormatOption(options.format, verify_options.forced_format)) {
        std::cerr << "Error: unknown format '" << options.format << "'" << std::endl;
        return kExitUsage;
    }
    verify_options.signature_path = options.signature;

    VerificationResult result;
    try {
        const auto [config, config_log] = loadSealConfigWithLog();
        spdlog::debug("config: {}", config_log);
        const auto registry = AdapterRegistry::with_defaults(config);
        const PublicKey key = KeyManager::load_public(options.key);

        ModelSigner signer(registry, config);
        result = signer.verify(options.path, key, verify_options);
    } catch (const SealError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }

    if (result.failure) {
        std::cerr << "Verification failed: " << to_string(result.failure->code) << ": " << result.failure->message
                  << std::endl;
        return kExitFailure;
    }

    for (const auto& mismatch : result.mismatches) {
        std::cout << "MISMATCH  " << mismatch.path << "  " << to_string(mismatch.reason) << std::endl;
    }
    std::cout << "Signature: " << to_string(result.signature) << std::endl;

    if (result.ok()) {
        std::cout << "Verified " << result.manifest->files.size() << " file(s) against "
                  << result.signature_path.string() << std::endl;
        return kExitOk;
    }
    std::cout << "Verification FAILED: " << result.mismatches.size() << " content mismatch(es)";
    if (result.signature_invalid()) std::cout << ", signature invalid";
    std::cout << std::endl;
    return kExitFailure;
}

}  // namespace commands
}  // namespace cli
}  // namespace modelseal
