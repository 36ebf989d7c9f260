#include "Loom/CliParser.hpp"
#include "Loom/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    Loom::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 signals --help and usage errors through exceptions.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    Loom::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
