#pragma once

#include <string>

namespace modelseal {

/// Subcommand types for the modelseal CLI
enum class Subcommand {
    None,       // No subcommand (prints help)
    Inspect,    // inspect <path>
    CreateKey,  // create-key --private-key P --public-key Q
    Sign,       // sign <path> --key P
    Verify,     // verify <path> --key Q
};

/// Options for inspect command
struct InspectOptions {
    std::string path;
    std::string format;        // empty = decided by the adapters
    std::string detail{"brief"};
    std::string filter;
};

/// Options for create-key command
struct CreateKeyOptions {
    std::string private_key;
    std::string public_key;
};

/// Options for sign command
struct SignCommandOptions {
    std::string path;
    std::string key;
    std::string output;  // empty = <path>.signature
    std::string format;
};

/// Options for verify command
struct VerifyCommandOptions {
    std::string path;
    std::string key;
    std::string signature;  // empty = <path>.signature
    std::string format;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true (2 for usage errors)
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};

    InspectOptions inspect_options;
    CreateKeyOptions create_key_options;
    SignCommandOptions sign_options;
    VerifyCommandOptions verify_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace modelseal
