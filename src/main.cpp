#include "Fcc/CliParser.hpp"
#include "Fcc/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Fcc::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports --help and usage errors through ParseError; app->exit
    // prints the message and maps it to the right exit code.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core loads the layered configuration and dispatches on the
    // subcommand that was triggered.
    try {
        Fcc::Core core(parser.getCommands());
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
