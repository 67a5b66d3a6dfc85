// create-key command: writes a fresh Ed25519 key pair to two files

#include "cli/commands.h"
#include "core/seal_error.h"
#include "signing/key_manager.h"
#include "utils/hex.h"
#include <exception>
#include <iostream>

namespace modelseal {
namespace cli {
namespace commands {

int createKey(const CreateKeyOptions& options) {
    try {
        const KeyPair pair = KeyManager::write_key_pair(options.private_key, options.public_key);
        std::cout << "Private key: " << options.private_key << std::endl;
        std::cout << "Public key:  " << options.public_key << std::endl;
        std::cout << "Fingerprint: " << to_hex(pair.public_key.fingerprint(HashAlgorithm::kBlake2b512))
                  << std::endl;
        return kExitOk;
    } catch (const SealError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return e.code() == ErrorCode::kInvalidArgument ? kExitUsage : kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

}  // namespace commands
}  // namespace cli
}  // namespace modelseal
