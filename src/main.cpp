#include <iostream>

#include "cli/commands.h"
#include "utils/cli.h"
#include "utils/logger.h"

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = modelseal::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    modelseal::logger::init_from_env();

    switch (cli_result.subcommand) {
        case modelseal::Subcommand::Inspect:
            return modelseal::cli::commands::inspect(cli_result.inspect_options);

        case modelseal::Subcommand::CreateKey:
            return modelseal::cli::commands::createKey(cli_result.create_key_options);

        case modelseal::Subcommand::Sign:
            return modelseal::cli::commands::sign(cli_result.sign_options);

        case modelseal::Subcommand::Verify:
            return modelseal::cli::commands::verify(cli_result.verify_options);

        case modelseal::Subcommand::None:
        default:
            std::cerr << modelseal::getHelpMessage();
            return modelseal::cli::commands::kExitUsage;
    }
}
