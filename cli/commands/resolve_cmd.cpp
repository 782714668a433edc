//
// Created by gregorian-rayne on 2/14/26.
//

#include "classmap/cli/commands/command.hpp"

#include "classmap/classmap.hpp"
#include "classmap/utils/path_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace classmap::cli
{
    /**
     * Resolve command - activates a loader for a directory and resolves
     * identifiers through the live resolver chain.
     */
    class ResolveCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "resolve";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Resolve class names to their defining files through a live loader";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: classmap resolve [OPTIONS] <DIRECTORY> <IDENTIFIER...>\n"
                   "\n"
                   "Exits with 1 if any identifier cannot be resolved.\n"
                   "\n"
                   "Examples:\n"
                   "  classmap resolve src/ 'App\\Kernel'\n"
                   "  classmap resolve --case-sensitive src/ 'App\\Http\\Request' 'App\\Kernel'";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return scan_arguments();
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() < 2) {
                return "Expected a directory and at least one identifier";
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

            auto& chain = loader::ResolverChain::instance();
            auto& autoloader = loader::Autoloader::instance();
            autoloader.set_warning_sink(warning_sink());
            MappingBuilder::instance().set_warning_sink(warning_sink());

            const auto& positional = args.positional();
            const fs::path directory = positional.front();

            if (auto active = autoloader.activate(directory, options.value()); active.is_err()) {
                print_error(active.error().to_string());
                return 1;
            }

            // Cache hit: same directory and options as the activation above.
            auto table = autoloader.generate_table(directory, options.value());
            if (table.is_err()) {
                print_error(table.error().to_string());
                return 1;
            }
            const SymbolMap& symbols = table.value();

            nlohmann::json results = nlohmann::json::object();
            bool all_resolved = true;

            for (std::size_t i = 1; i < positional.size(); ++i) {
                const std::string& identifier = positional[i];
                const fs::path* file = options.value().case_sensitive
                    ? symbols.find(identifier)
                    : symbols.find_case_insensitive(identifier);

                if (!chain.resolve(identifier) || file == nullptr) {
                    all_resolved = false;
                    if (is_json()) {
                        results[identifier] = nullptr;
                    } else {
                        print_error("Cannot resolve " + identifier);
                    }
                    continue;
                }

                if (is_json()) {
                    results[identifier] = path_utils::to_forward_slashes(*file);
                } else {
                    print(identifier + " => " + path_utils::to_forward_slashes(*file));
                }
            }

            if (is_json()) {
                std::cout << results.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            }

            print_verbose("Included files: " + std::to_string(chain.included_files().size()));
            return all_resolved ? 0 : 1;
        }
    };

    namespace {
        struct ResolveCommandRegistrar {
            ResolveCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<ResolveCommand>());
            }
        } resolve_registrar;
    }

}  // namespace classmap::cli
