#include "ContextStudio/CliParser.hpp"
#include "ContextStudio/Core.hpp"
#include <iostream>
#include <csignal>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    ContextStudio::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

#if !defined(_WIN32)
    // A clipboard tool that exits early must not kill us on write
    std::signal(SIGPIPE, SIG_IGN);
#endif

    ContextStudio::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
