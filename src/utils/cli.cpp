#include "utils/cli.h"
#include "utils/version.h"
#include <cstring>
#include <sstream>

namespace modelseal {

constexpr int USAGE_ERROR = 2;

std::string getInspectHelpMessage();
std::string getCreateKeyHelpMessage();
std::string getSignHelpMessage();
std::string getVerifyHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "modelseal " << MODELSEAL_VERSION << " - model inspection and signing\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelseal <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    inspect     Show the tensors and metadata of a model file\n";
    oss << "    create-key  Generate an Ed25519 key pair\n";
    oss << "    sign        Sign a model file, index or directory\n";
    oss << "    verify      Verify a model against its signature\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    MODELSEAL_CONFIG              Config file (default: ~/.modelseal/config.json)\n";
    oss << "    MODELSEAL_HASH_WORKERS        Hashing threads (default: CPU count)\n";
    oss << "    MODELSEAL_HASH_ALGORITHM      BLAKE2b512 (default) or SHA256\n";
    oss << "    MODELSEAL_LOG_LEVEL           Log level (trace|debug|info|warn|error)\n";
    oss << "    MODELSEAL_LOG_DIR             Also write daily JSON log files here\n";
    oss << "\n";
    oss << "Run 'modelseal <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getInspectHelpMessage() {
    std::ostringstream oss;
    oss << "modelseal inspect - Show the tensors and metadata of a model file\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelseal inspect <PATH> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --format <FORMAT>    Force a format (safetensors|gguf|pytorch|onnx)\n";
    oss << "    --detail <LEVEL>     brief (default) or full\n";
    oss << "    --filter <TEXT>      Only list tensors whose name contains TEXT\n";
    oss << "    -h, --help           Print help\n";
    return oss.str();
}

std::string getCreateKeyHelpMessage() {
    std::ostringstream oss;
    oss << "modelseal create-key - Generate an Ed25519 key pair\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelseal create-key --private-key <FILE> --public-key <FILE>\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --private-key <FILE>  PKCS#8 private key output (mode 0600)\n";
    oss << "    --public-key <FILE>   Raw public key output\n";
    oss << "    -h, --help            Print help\n";
    return oss.str();
}

std::string getSignHelpMessage() {
    std::ostringstream oss;
    oss << "modelseal sign - Sign a model file, index or directory\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelseal sign <PATH> --key <FILE> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -K, --key <FILE>      Private key\n";
    oss << "    -o, --output <FILE>   Signature output (default: <PATH>.signature)\n";
    oss << "    --format <FORMAT>     Force a format for reference resolution\n";
    oss << "    -h, --help            Print help\n";
    return oss.str();
}

std::string getVerifyHelpMessage() {
    std::ostringstream oss;
    oss << "modelseal verify - Verify a model against its signature\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelseal verify <PATH> --key <FILE> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -K, --key <FILE>        Public key\n";
    oss << "    -S, --signature <FILE>  Signature file (default: <PATH>.signature)\n";
    oss << "    --format <FORMAT>       Force a format for reference resolution\n";
    oss << "    -h, --help              Print help\n";
    oss << "\n";
    oss << "Exit status is 0 only when every file matches and the signature is valid.\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "modelseal " << MODELSEAL_VERSION << "\n";
    return oss.str();
}

namespace {

bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

bool is_flag(const char* arg, const char* long_name, const char* short_name = nullptr) {
    return std::strcmp(arg, long_name) == 0 || (short_name && std::strcmp(arg, short_name) == 0);
}

void usage_error(CliResult& result, const std::string& message, const std::string& usage) {
    result.should_exit = true;
    result.exit_code = USAGE_ERROR;
    result.output = "Error: " + message + "\n\n" + usage;
}

// Reads the value of the option at argv[i]; false when it is missing.
bool take_value(int argc, char* argv[], int& i, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

// Returns false (and fills result) on a usage error.
bool take_positional(CliResult& result, const char* arg, std::string& out, const std::string& usage) {
    if (arg[0] == '-') {
        usage_error(result, std::string("unknown option '") + arg + "'", usage);
        return false;
    }
    if (!out.empty()) {
        usage_error(result, std::string("unexpected argument '") + arg + "'", usage);
        return false;
    }
    out = arg;
    return true;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - show help
    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = USAGE_ERROR;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    // Global help and version
    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "inspect") == 0) {
        result.subcommand = Subcommand::Inspect;
        const std::string usage = getInspectHelpMessage();
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.output = usage;
            return result;
        }

        auto& opts = result.inspect_options;
        for (int i = 2; i < argc; ++i) {
            std::string* target = nullptr;
            if (is_flag(argv[i], "--format", "-f")) {
                target = &opts.format;
            } else if (is_flag(argv[i], "--detail", "-D")) {
                target = &opts.detail;
            } else if (is_flag(argv[i], "--filter")) {
                target = &opts.filter;
            } else if (!take_positional(result, argv[i], opts.path, usage)) {
                return result;
            }
            if (target && !take_value(argc, argv, i, *target)) {
                usage_error(result, std::string("missing value for ") + argv[i], usage);
                return result;
            }
        }

        if (opts.path.empty()) {
            usage_error(result, "model path required", usage);
        } else if (opts.detail != "brief" && opts.detail != "full") {
            usage_error(result, "--detail must be 'brief' or 'full'", usage);
        }
        return result;
    }

    if (std::strcmp(command, "create-key") == 0) {
        result.subcommand = Subcommand::CreateKey;
        const std::string usage = getCreateKeyHelpMessage();
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.output = usage;
            return result;
        }

        auto& opts = result.create_key_options;
        for (int i = 2; i < argc; ++i) {
            std::string* target = nullptr;
            if (is_flag(argv[i], "--private-key")) {
                target = &opts.private_key;
            } else if (is_flag(argv[i], "--public-key")) {
                target = &opts.public_key;
            } else {
                usage_error(result, std::string("unexpected argument '") + argv[i] + "'", usage);
                return result;
            }
            if (!take_value(argc, argv, i, *target)) {
                usage_error(result, std::string("missing value for ") + argv[i], usage);
                return result;
            }
        }

        if (opts.private_key.empty() || opts.public_key.empty()) {
            usage_error(result, "--private-key and --public-key are required", usage);
        }
        return result;
    }

    if (std::strcmp(command, "sign") == 0) {
        result.subcommand = Subcommand::Sign;
        const std::string usage = getSignHelpMessage();
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.output = usage;
            return result;
        }

        auto& opts = result.sign_options;
        for (int i = 2; i < argc; ++i) {
            std::string* target = nullptr;
            if (is_flag(argv[i], "--key", "-K")) {
                target = &opts.key;
            } else if (is_flag(argv[i], "--output", "-o")) {
                target = &opts.output;
            } else if (is_flag(argv[i], "--format", "-f")) {
                target = &opts.format;
            } else if (!take_positional(result, argv[i], opts.path, usage)) {
                return result;
            }
            if (target && !take_value(argc, argv, i, *target)) {
                usage_error(result, std::string("missing value for ") + argv[i], usage);
                return result;
            }
        }

        if (opts.path.empty()) {
            usage_error(result, "model path required", usage);
        } else if (opts.key.empty()) {
            usage_error(result, "--key is required", usage);
        }
        return result;
    }

    if (std::strcmp(command, "verify") == 0) {
        result.subcommand = Subcommand::Verify;
        const std::string usage = getVerifyHelpMessage();
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.output = usage;
            return result;
        }

        auto& opts = result.verify_options;
        for (int i = 2; i < argc; ++i) {
            std::string* target = nullptr;
            if (is_flag(argv[i], "--key", "-K")) {
                target = &opts.key;
            } else if (is_flag(argv[i], "--signature", "-S")) {
                target = &opts.signature;
            } else if (is_flag(argv[i], "--format", "-f")) {
                target = &opts.format;
            } else if (!take_positional(result, argv[i], opts.path, usage)) {
                return result;
            }
            if (target && !take_value(argc, argv, i, *target)) {
                usage_error(result, std::string("missing value for ") + argv[i], usage);
                return result;
            }
        }

        if (opts.path.empty()) {
            usage_error(result, "model path required", usage);
        } else if (opts.key.empty()) {
            usage_error(result, "--key is required", usage);
        }
        return result;
    }

    result.should_exit = true;
    result.exit_code = USAGE_ERROR;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Inspect: return "inspect";
        case Subcommand::CreateKey: return "create-key";
        case Subcommand::Sign: return "sign";
        case Subcommand::Verify: return "verify";
        default: return "unknown";
    }
}

}  // namespace modelseal
