//
// Created by gregorian-rayne on 2/13/26.
//

#include "classmap/cli/commands/command.hpp"

#include "classmap/classmap.hpp"
#include "classmap/utils/file_utils.hpp"
#include "classmap/utils/path_utils.hpp"

#include <filesystem>

namespace classmap::cli
{
    namespace fs = std::filesystem;

    /**
     * Generate command - writes a standalone PHP loader or a JSON table.
     */
    class GenerateCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "generate";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Generate a standalone autoloader (PHP) or data table (JSON)";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: classmap generate [OPTIONS] <DIRECTORY> -o <FILE>\n"
                   "\n"
                   "The format is taken from --format, or from the output extension\n"
                   "(.json for JSON, anything else for PHP). Paths are written relative\n"
                   "to the output file, which must then sit in <DIRECTORY> itself;\n"
                   "anywhere else, absolute paths are written instead.\n"
                   "\n"
                   "Examples:\n"
                   "  classmap generate src/ -o src/autoload.php\n"
                   "  classmap generate --namespace App --prepend src/ -o src/autoload.php\n"
                   "  classmap generate --absolute src/ -o build/classmap.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = scan_arguments();
            args.push_back({"output", 'o', "Output file (required)", true, true, "", "FILE"});
            args.push_back({"format", 'f', "Output format (php, json)", false, true, "", "FORMAT"});
            args.push_back({"absolute", 'a', "Write absolute paths instead of paths relative to the root", false, false, "", ""});
            args.push_back({"prepend", 'p', "Register ahead of existing autoloaders", false, false, "", ""});
            args.push_back({"namespace", 'n', "Namespace shown in the loader header", false, true, "", "NS"});
            args.push_back({"class-name", 0, "Class name shown in the loader header", false, true, "", "NAME"});
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one directory";
            }

            if (auto output = args.get("output"); !output || output->empty()) {
                return "Output file is required (-o FILE)";
            }

            if (auto format = args.get("format"); format && *format != "php" && *format != "json") {
                return "Unknown format: " + *format + " (expected php or json)";
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

            const fs::path output = *args.get("output");
            std::string format = args.get_or("format", "");
            if (format.empty()) {
                format = path_utils::lowercase_extension(output) == "json" ? "json" : "php";
            }

            auto& autoloader = loader::Autoloader::instance();
            autoloader.set_warning_sink(warning_sink());
            MappingBuilder::instance().set_warning_sink(warning_sink());

            const fs::path directory = args.positional().front();
            Options render_options = options.value();
            if (render_options.relative && !output_in_root(output, directory)) {
                print_warning("Output is not inside " + path_utils::to_forward_slashes(directory) +
                              ", writing absolute paths");
                render_options.relative = false;
            }

            auto rendered = format == "json"
                ? autoloader.render_json(directory, render_options)
                : autoloader.render_source(directory, render_options);
            if (rendered.is_err()) {
                print_error(rendered.error().to_string());
                return 1;
            }

            if (auto written = file_utils::write_file(output, rendered.value()); written.is_err()) {
                print_error(written.error().to_string());
                return 1;
            }

            print("Generated " + format + " loader: " + path_utils::to_forward_slashes(output));
            return 0;
        }
    };

    namespace {
        struct GenerateCommandRegistrar {
            GenerateCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<GenerateCommand>());
            }
        } generate_registrar;
    }

}  // namespace classmap::cli
