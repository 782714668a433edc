//
// Created by gregorian-rayne on 2/10/26.
//

#include "classmap/options.hpp"
#include "classmap/utils/file_utils.hpp"
#include "classmap/utils/path_utils.hpp"
#include "classmap/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <sstream>

namespace classmap {

    namespace {

        std::string normalize_extension(std::string_view ext) {
            if (!ext.empty() && ext.front() == '.') {
                ext.remove_prefix(1);
            }
            return string_utils::to_lower(ext);
        }

        void read_string_array(const toml::node_view<toml::node> node, std::vector<std::string>& out) {
            if (!node || !node.is_array()) {
                return;
            }
            out.clear();
            for (auto& element : *node.as_array()) {
                out.emplace_back(element.value_or(std::string{}));
            }
        }

        void write_string_array(std::ostringstream& ss, const std::vector<std::string>& values) {
            ss << "[";
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << "\"" << string_utils::replace_all(values[i], "\\", "\\\\") << "\"";
            }
            ss << "]";
        }

        bool is_label_start(const unsigned char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
        }

        bool is_label_char(const unsigned char c) noexcept {
            return is_label_start(c) || (c >= '0' && c <= '9');
        }

    }  // namespace

    bool is_php_label(const std::string_view name) noexcept {
        if (name.empty() || !is_label_start(static_cast<unsigned char>(name.front()))) {
            return false;
        }
        return std::ranges::all_of(name, [](const char c) {
            return is_label_char(static_cast<unsigned char>(c));
        });
    }

    Result<Options, Error> Options::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Options, Error>::failure(
                Error::config_error("Configuration file not readable", path.string())
            );
        }

        auto options = load_from_string(content.value());
        if (options.is_err()) {
            return Result<Options, Error>::failure(options.error().with_context(path.string()));
        }
        return options;
    }

    Result<Options, Error> Options::load_from_string(const std::string_view content) {
        try {
            auto tbl = toml::parse(content);
            Options options;

            if (tbl["scan"]) {
                auto scan = tbl["scan"];
                read_string_array(scan["extensions"], options.extensions);
                read_string_array(scan["exclude"], options.exclude);
                if (scan["follow_symlinks"])
                    options.follow_symlinks = scan["follow_symlinks"].value_or(false);
                if (scan["include_static"])
                    options.include_static = scan["include_static"].value_or(false);
            }

            if (tbl["loader"]) {
                auto loader = tbl["loader"];
                if (loader["case_sensitive"])
                    options.case_sensitive = loader["case_sensitive"].value_or(false);
                if (loader["prepend"])
                    options.prepend = loader["prepend"].value_or(false);
            }

            if (tbl["generate"]) {
                auto generate = tbl["generate"];
                if (generate["relative"])
                    options.relative = generate["relative"].value_or(true);
                if (generate["namespace"])
                    options.namespace_name = generate["namespace"].value_or(std::string{});
                if (generate["class_name"])
                    options.class_name = generate["class_name"].value_or(std::string{"Autoloader"});
            }

            if (auto validation = options.validate(); validation.is_err()) {
                return Result<Options, Error>::failure(validation.error());
            }

            return Result<Options, Error>::success(std::move(options));

        } catch (const toml::parse_error& err) {
            return Result<Options, Error>::failure(
                Error::config_error("Failed to parse TOML configuration", std::string(err.description()))
            );
        }
    }

    Result<void, Error> Options::validate() const {
        std::vector<std::string> errors;

        if (extensions.empty()) {
            errors.emplace_back("extensions must not be empty");
        }

        for (const auto& ext : extensions) {
            if (normalize_extension(ext).empty()) {
                errors.emplace_back("extensions must not contain empty entries");
                break;
            }
        }

        for (const auto& pattern : exclude) {
            if (pattern.empty()) {
                errors.emplace_back("exclude must not contain empty patterns");
                break;
            }
        }

        if (!is_php_label(class_name)) {
            errors.emplace_back("class_name '" + class_name + "' is not a valid PHP identifier");
        }

        if (!namespace_name.empty()) {
            for (const auto segment : string_utils::split(string_utils::trim_char(namespace_name, '\\'), '\\')) {
                if (!is_php_label(segment)) {
                    errors.emplace_back("namespace '" + namespace_name + "' is not a valid PHP namespace");
                    break;
                }
            }
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

    std::string Options::fingerprint() const {
        std::ostringstream ss;
        ss << "extensions=" << string_utils::join(extensions, ",") << "\n";
        ss << "exclude=" << string_utils::join(exclude, "\x1f") << "\n";
        ss << "case_sensitive=" << case_sensitive << "\n";
        ss << "follow_symlinks=" << follow_symlinks << "\n";
        ss << "prepend=" << prepend << "\n";
        ss << "include_static=" << include_static << "\n";
        ss << "relative=" << relative << "\n";
        ss << "namespace=" << namespace_name << "\n";
        ss << "class_name=" << class_name << "\n";
        return ss.str();
    }

    std::string Options::to_string() const {
        std::ostringstream ss;

        ss << "[scan]\n";
        ss << "extensions = ";
        write_string_array(ss, extensions);
        ss << "\n";
        ss << "exclude = ";
        write_string_array(ss, exclude);
        ss << "\n";
        ss << "follow_symlinks = " << (follow_symlinks ? "true" : "false") << "\n";
        ss << "include_static = " << (include_static ? "true" : "false") << "\n\n";

        ss << "[loader]\n";
        ss << "case_sensitive = " << (case_sensitive ? "true" : "false") << "\n";
        ss << "prepend = " << (prepend ? "true" : "false") << "\n\n";

        ss << "[generate]\n";
        ss << "relative = " << (relative ? "true" : "false") << "\n";
        ss << "namespace = \"" << string_utils::replace_all(namespace_name, "\\", "\\\\") << "\"\n";
        ss << "class_name = \"" << class_name << "\"\n";

        return ss.str();
    }

    bool Options::matches_extension(const fs::path& file) const {
        const auto ext = path_utils::lowercase_extension(file);
        if (ext.empty()) {
            return false;
        }
        return std::ranges::any_of(extensions, [&](const std::string& configured) {
            return normalize_extension(configured) == ext;
        });
    }

    bool Options::is_excluded(const std::string_view relative_path) const {
        return std::ranges::any_of(exclude, [&](const std::string& pattern) {
            return string_utils::glob_match(pattern, relative_path);
        });
    }

}  // namespace classmap
