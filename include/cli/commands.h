#pragma once

#include <optional>
#include <string>

#include "model/canonical_model.h"
#include "utils/cli.h"

namespace modelseal {
namespace cli {
namespace commands {

// Exit codes shared by all commands.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/// Parse a --format value. Empty text yields std::nullopt.
/// @return false when the text names no known format
bool parseFormatOption(const std::string& text, std::optional<ModelFormat>& out);

/// Execute the 'inspect' command
/// @return Exit code (0=success, 1=error, 2=usage error)
int inspect(const InspectOptions& options);

/// Execute the 'create-key' command
/// @return Exit code (0=success, 1=error, 2=usage error)
int createKey(const CreateKeyOptions& options);

/// Execute the 'sign' command
/// @return Exit code (0=success, 1=error, 2=usage error)
int sign(const SignCommandOptions& options);

/// Execute the 'verify' command
/// @return Exit code (0=verified, 1=verification failed or error, 2=usage error)
int verify(const VerifyCommandOptions& options);

}  // namespace commands
}  // namespace cli
}  // namespace modelseal
