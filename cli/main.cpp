//
// Created by gregorian-rayne on 2/14/26.
//

#include "classmap/cli/commands/command.hpp"
#include "classmap/version.hpp"

#include <iomanip>
#include <iostream>
#include <exception>
#include <string>
#include <vector>

namespace {

    void print_help() {
        std::cout << classmap::PROJECT_NAME << " " << classmap::VERSION_STRING
                  << " - PHP class map scanner and autoloader generator\n\n"
                  << "Usage: classmap <COMMAND> [OPTIONS] <DIRECTORY> [ARGS...]\n\n"
                  << "Commands:\n";
        for (const auto* cmd : classmap::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun 'classmap <COMMAND> --help' for command options.\n";
    }

    void print_version() {
        std::cout << classmap::PROJECT_NAME << " " << classmap::VERSION_STRING << "\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        using namespace classmap::cli;

        if (argc < 2) {
            print_help();
            return 1;
        }

        const std::string command_name = argv[1];
        if (command_name == "help" || command_name == "--help" || command_name == "-h") {
            print_help();
            return 0;
        }
        if (command_name == "version" || command_name == "--version") {
            print_version();
            return 0;
        }

        Command* command = CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            std::cerr << "error: Unknown command: " << command_name << "\n\n";
            print_help();
            return 1;
        }

        const std::vector<std::string> rest(argv + 2, argv + argc);
        const ParseResult parsed = parse_arguments(rest, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            std::cerr << command->usage() << "\n";
            return 1;
        }

        if (parsed.args.get_flag("help")) {
            command->print_help();
            return 0;
        }

        if (const std::string problem = command->validate(parsed.args); !problem.empty()) {
            std::cerr << "error: " << problem << "\n";
            std::cerr << command->usage() << "\n";
            return 1;
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Unknown fatal error occurred\n";
        return 1;
    }
}
