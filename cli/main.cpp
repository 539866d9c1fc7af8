#include "cli_parser.hpp"
#include "app.hpp"
#include <iostream>
#include <exception>

int main(const int argc, char** argv) {
    try {
        const psa::cli::Options options = psa::cli::CliParser::parse(argc, argv);

        if (options.command == psa::cli::Command::HELP) {
            psa::cli::CliParser::print_help();
            return 0;
        }

        if (options.command == psa::cli::Command::VERSION) {
            psa::cli::CliParser::print_version();
            return 0;
        }

        psa::cli::App app(options);
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
