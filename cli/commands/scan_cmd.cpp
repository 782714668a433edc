//
// Created by gregorian-rayne on 2/13/26.
//

#include "classmap/cli/commands/command.hpp"

#include "classmap/classmap.hpp"
#include "classmap/loader/renderer.hpp"
#include "classmap/utils/path_utils.hpp"

#include <iostream>

namespace classmap::cli
{
    /**
     * Scan command - prints the identifier to file table for a directory.
     */
    class ScanCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "scan";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Scan a directory and print every declared class, interface, trait and enum";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: classmap scan [OPTIONS] <DIRECTORY>\n"
                   "\n"
                   "Examples:\n"
                   "  classmap scan src/\n"
                   "  classmap scan --exclude 'tests/*,vendor/*' --include-static lib/\n"
                   "  classmap scan --json --ext php,inc legacy/";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return scan_arguments();
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one directory";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);

            auto options = options_from_args(args);
            if (options.is_err()) {
                print_error(options.error().to_string());
                return 1;
            }

            MappingBuilder builder(warning_sink());
            auto built = builder.build(args.positional().front(), options.value());
            if (built.is_err()) {
                print_error(built.error().to_string());
                return 1;
            }

            const ClassMap& map = built.value();
            if (map.empty()) {
                print_error("No symbols found in " + map.root.string());
                return 1;
            }

            if (is_json()) {
                // The table printed to stdout has no artifact location to be relative to.
                Options json_options = options.value();
                json_options.relative = false;
                const loader::ArtifactRenderer renderer(json_options, loader::ArtifactRenderer::current_timestamp());
                std::cout << renderer.render_json(map) << "\n";
                return 0;
            }

            for (const auto& [identifier, file] : map.symbols) {
                print(identifier + " => " + path_utils::to_forward_slashes(file));
            }
            if (!map.static_files.empty()) {
                print("");
                print("Static files:");
                for (const auto& file : map.static_files) {
                    print("  " + path_utils::to_forward_slashes(file));
                }
            }

            print_verbose("");
            print_verbose("Files visited:     " + std::to_string(map.stats.files_visited));
            print_verbose("Files scanned:     " + std::to_string(map.stats.files_scanned));
            print_verbose("Files failed:      " + std::to_string(map.stats.files_failed));
            print_verbose("Static files:      " + std::to_string(map.stats.static_files));
            print_verbose("Duplicate symbols: " + std::to_string(map.stats.duplicate_symbols));
            print_verbose("Total symbols:     " + std::to_string(map.symbols.size()));

            return 0;
        }
    };

    namespace {
        struct ScanCommandRegistrar {
            ScanCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<ScanCommand>());
            }
        } scan_registrar;
    }

}  // namespace classmap::cli
