//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CLASSMAP_MAPPING_BUILDER_HPP
#define CLASSMAP_MAPPING_BUILDER_HPP

/**
 * @file mapping_builder.hpp
 * @brief Builds and memoizes the class map of a directory.
 *
 * A scan walks the tree, tokenizes every candidate, extracts its
 * declarations and merges them into one table; a later declaration of the
 * same identifier replaces the earlier one. Results are cached per
 * (canonical directory, options) and are never invalidated by changes on
 * disk; call clear_cache() to force a rescan.
 *
 * @code
 *     auto map = MappingBuilder::instance().build("src", Options{});
 *     if (map.is_ok()) {
 *         for (const auto& [id, file] : map.value().symbols) { ... }
 *     }
 * @endcode
 */

#include "classmap/diagnostics.hpp"
#include "classmap/error.hpp"
#include "classmap/options.hpp"
#include "classmap/result.hpp"
#include "classmap/types.hpp"
#include "classmap/scanner/tree_walker.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace classmap {

    namespace fs = std::filesystem;

    class MappingBuilder {
    public:
        explicit MappingBuilder(WarningSink sink = stderr_warning_sink());

        /**
         * Process-wide builder shared by the loader façade and the CLI.
         */
        static MappingBuilder& instance();

        /**
         * Scans @p directory, or returns the cached result of an identical
         * earlier scan.
         *
         * An empty ClassMap is a success here; callers decide whether an
         * empty result is an error.
         *
         * @return NotFound, InvalidArgument or PermissionDenied for a bad
         *         root, ConfigError for invalid options.
         */
        Result<ClassMap, Error> build(const fs::path& directory, const Options& options);

        /**
         * True if a build of @p directory with @p options would hit the cache.
         */
        [[nodiscard]] bool is_cached(const fs::path& directory, const Options& options) const;

        void clear_cache() noexcept;

        [[nodiscard]] std::size_t cache_size() const noexcept {
            return cache_.size();
        }

        void set_warning_sink(WarningSink sink) {
            sink_ = std::move(sink);
        }

        [[nodiscard]] const WarningSink& warning_sink() const noexcept {
            return sink_;
        }

        /**
         * md5 of the canonical directory and the options fingerprint.
         */
        static Result<std::string, Error> cache_key(const fs::path& canonical_dir, const Options& options);

    private:
        void scan_file(const scanner::WalkEntry& entry, const Options& options, ClassMap& map) const;

        std::unordered_map<std::string, ClassMap> cache_;
        WarningSink sink_;
    };

}  // namespace classmap

#endif //CLASSMAP_MAPPING_BUILDER_HPP
