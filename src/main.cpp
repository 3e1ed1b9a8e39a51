#include "Relay/CliParser.hpp"
#include "Relay/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line arguments using CLI11.
    Relay::CliParser parser;
    auto app = parser.setupCli();

    // CLI11's exit exceptions (help, parse errors) are turned into exit codes.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core owns the monitor and dispatches to the selected subcommand.
    try {
        Relay::Core core(parser.getCommands());
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
