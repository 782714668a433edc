//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef CLASSMAP_COMMAND_HPP
#define CLASSMAP_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Base class and argument parsing for classmap subcommands.
 *
 * Every subcommand registers itself with CommandRegistry at static
 * initialization time; main() looks it up by name, parses the remaining
 * arguments against its ArgDefs and runs it.
 */

#include "classmap/diagnostics.hpp"
#include "classmap/error.hpp"
#include "classmap/options.hpp"
#include "classmap/result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace classmap::cli
{
    /**
     * Command-line argument definition.
     */
    struct ArgDef {
        std::string name;           // Long name (--name)
        char short_name = 0;        // Short name (-n)
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";  // For help text
    };

    /**
     * Parsed command-line arguments.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;
        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::string> args_;
        std::unordered_map<std::string, bool> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,      // Only errors
        Normal,
        Verbose     // Scan statistics and skipped files
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    /**
     * Base class for all subcommands.
     */
    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Runs the command.
         *
         * @return Exit code (0 = success).
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * @return Error message if the arguments are unusable, empty otherwise.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        void set_verbosity(Verbosity v) { verbosity_ = v; }
        void set_output_format(OutputFormat f) { output_format_ = f; }

        /**
         * Applies --verbose, --quiet and --json.
         */
        void apply_common_flags(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;

        /**
         * Warning sink that routes library warnings through print_warning().
         */
        [[nodiscard]] WarningSink warning_sink() const;

        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    /**
     * Registry of subcommands.
     */
    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments that follow the command name.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

    /**
     * Scan options shared by every command that scans a directory.
     */
    [[nodiscard]] std::vector<ArgDef> scan_arguments();

    /**
     * Builds Options from --config (if given) overlaid with the scan and
     * generator flags on the command line.
     */
    [[nodiscard]] Result<Options, Error> options_from_args(const ParsedArgs& args);

    /**
     * True if @p output would be written directly into @p root, so that
     * root-relative paths in the artifact resolve against its __DIR__.
     * Also true when @p root cannot be resolved; the scan reports that.
     */
    [[nodiscard]] bool output_in_root(const fs::path& output, const fs::path& root);

}  // namespace classmap::cli

#endif //CLASSMAP_COMMAND_HPP
