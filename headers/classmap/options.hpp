//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CLASSMAP_OPTIONS_HPP
#define CLASSMAP_OPTIONS_HPP

/**
 * @file options.hpp
 * @brief Scan, loader and generator configuration.
 *
 * One Options value configures every operation. Fields that only apply to
 * one operation are ignored by the others:
 *
 * | field            | default        | used by                     |
 * |------------------|----------------|-----------------------------|
 * | extensions       | {"php"}        | scanning                    |
 * | exclude          | {}             | scanning                    |
 * | case_sensitive   | false          | resolver, generated loader  |
 * | follow_symlinks  | false          | scanning                    |
 * | prepend          | false          | live registration, artifact |
 * | include_static   | false          | scanning, loading           |
 * | relative         | true           | source / JSON artifact      |
 * | namespace_name   | ""             | source artifact header      |
 * | class_name       | "Autoloader"   | source artifact header      |
 *
 * Options can be loaded from a TOML file:
 * @code
 *     [scan]
 *     extensions = ["php", "inc"]
 *     exclude = ["vendor/*"]
 *
 *     [loader]
 *     case_sensitive = true
 * @endcode
 */

#include "classmap/result.hpp"
#include "classmap/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace classmap {

    namespace fs = std::filesystem;

    struct Options {
        std::vector<std::string> extensions = {"php"};
        std::vector<std::string> exclude;
        bool case_sensitive = false;
        bool follow_symlinks = false;
        bool prepend = false;
        bool include_static = false;
        bool relative = true;
        std::string namespace_name;
        std::string class_name = "Autoloader";

        /**
         * Loads options from a TOML file. Missing keys keep their defaults.
         */
        static Result<Options, Error> load_from_file(const fs::path& path);

        /**
         * Parses options from TOML text.
         */
        static Result<Options, Error> load_from_string(std::string_view content);

        /**
         * Checks extensions, exclude patterns and the generator names.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Stable text rendering of every field, used for scan cache keys.
         */
        [[nodiscard]] std::string fingerprint() const;

        /**
         * Serializes the options back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * True if the file's lowercased extension is one of `extensions`.
         * Configured extensions may be given with or without a leading dot.
         */
        [[nodiscard]] bool matches_extension(const fs::path& file) const;

        /**
         * True if a root-relative path matches any `exclude` pattern.
         */
        [[nodiscard]] bool is_excluded(std::string_view relative_path) const;
    };

    /**
     * True if @p name is a valid PHP label ([A-Za-z_\x80-\xff][A-Za-z0-9_\x80-\xff]*).
     */
    [[nodiscard]] bool is_php_label(std::string_view name) noexcept;

}  // namespace classmap

#endif //CLASSMAP_OPTIONS_HPP
