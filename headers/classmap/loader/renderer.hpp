//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CLASSMAP_RENDERER_HPP
#define CLASSMAP_RENDERER_HPP

/**
 * @file renderer.hpp
 * @brief Standalone loader artifacts.
 *
 * Two artifact formats are supported:
 * - PHP source: a file that, when required once, registers an autoloader
 *   equivalent to MappingResolver. It does not depend on this library.
 * - JSON: a plain data table for other tooling.
 *
 * With `relative` set, every path is written relative to the scanned root,
 * which is also where the artifact is expected to live. Moving the root
 * and the artifact together keeps every path valid.
 */

#include "classmap/error.hpp"
#include "classmap/options.hpp"
#include "classmap/result.hpp"
#include "classmap/types.hpp"

#include <filesystem>
#include <string>

namespace classmap::loader {

    namespace fs = std::filesystem;

    class ArtifactRenderer {
    public:
        /**
         * @param options Uses case_sensitive, prepend, relative, namespace_name and class_name.
         * @param generated_at Timestamp written into the artifact header.
         */
        ArtifactRenderer(Options options, std::string generated_at);

        /**
         * PHP loader source for @p map.
         *
         * @return The source, or InternalError if the guard id cannot be hashed.
         */
        [[nodiscard]] Result<std::string, Error> render_source(const ClassMap& map) const;

        /**
         * JSON data table for @p map, pretty-printed with two spaces.
         */
        [[nodiscard]] std::string render_json(const ClassMap& map) const;

        /**
         * PHP expression for @p file: `__DIR__ . '/rel/path.php'` when
         * relative rendering applies, a quoted absolute path otherwise.
         */
        [[nodiscard]] std::string path_expression(const fs::path& base_dir, const fs::path& file) const;

        /**
         * Path string for the JSON table: `./rel/path.php` or absolute.
         */
        [[nodiscard]] std::string json_path(const fs::path& base_dir, const fs::path& file) const;

        /**
         * Name shown in the artifact header, e.g. `App\Autoloader`.
         */
        [[nodiscard]] std::string wrapper_name() const;

        /**
         * Local time as "YYYY-MM-DD HH:MM:SS".
         */
        static std::string current_timestamp();

    private:
        /**
         * Relative form of @p file below @p base_dir with a leading '/', or
         * an empty string when either path cannot be canonicalized.
         */
        [[nodiscard]] std::string relative_form(const fs::path& base_dir, const fs::path& file) const;

        Options options_;
        std::string generated_at_;
    };

}  // namespace classmap::loader

#endif //CLASSMAP_RENDERER_HPP
