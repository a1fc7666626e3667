#include <iostream>

#include "cli/commands.h"
#include "utils/cli.h"
#include "utils/logger.h"

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = modelswitch::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        auto& stream = cli_result.exit_code == 0 ? std::cout : std::cerr;
        stream << cli_result.output;
        return cli_result.exit_code;
    }

    modelswitch::logger::init_from_env();

    switch (cli_result.subcommand) {
        case modelswitch::Subcommand::List:
            return modelswitch::cli::commands::list(cli_result);

        case modelswitch::Subcommand::Test:
            return modelswitch::cli::commands::test(cli_result);

        case modelswitch::Subcommand::Auto:
            return modelswitch::cli::commands::autoSelect(cli_result);

        case modelswitch::Subcommand::None:
        default:
            std::cout << modelswitch::getHelpMessage();
            return 0;
    }
}
