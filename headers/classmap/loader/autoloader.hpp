//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CLASSMAP_AUTOLOADER_HPP
#define CLASSMAP_AUTOLOADER_HPP

/**
 * @file autoloader.hpp
 * @brief Loader façade: live registration, artifacts and bookkeeping.
 *
 * Usage:
 * @code
 *     auto& autoloader = Autoloader::instance();
 *     if (auto active = autoloader.activate("src", Options{}); active.is_err()) {
 *         std::cerr << active.error() << "\n";
 *     }
 *     ResolverChain::instance().resolve("App\\Kernel");
 *
 *     auto source = autoloader.render_source("src", Options{});
 *     // write source.value() to src/autoload.php
 * @endcode
 */

#include "classmap/diagnostics.hpp"
#include "classmap/error.hpp"
#include "classmap/mapping_builder.hpp"
#include "classmap/options.hpp"
#include "classmap/result.hpp"
#include "classmap/types.hpp"
#include "classmap/loader/host.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace classmap::loader {

    namespace fs = std::filesystem;

    /**
     * Summary of one active loader.
     */
    struct LoaderInfo {
        fs::path directory;
        std::size_t symbol_count = 0;
    };

    class Autoloader {
    public:
        /**
         * @param host Receives resolver registrations. Must outlive the façade.
         * @param builder Scans and caches class maps. Must outlive the façade.
         */
        Autoloader(IHostLoader& host, MappingBuilder& builder);

        /**
         * Façade over ResolverChain::instance() and MappingBuilder::instance().
         */
        static Autoloader& instance();

        /**
         * Scans @p directory and registers a resolver for it with the host.
         * With include_static, every static file is included right away.
         *
         * @return UnsupportedHost, a root error, EmptyResult or
         *         RegistrationError on failure; nothing is retained then.
         */
        Result<void, Error> activate(const fs::path& directory, const Options& options);

        /**
         * Identifier to absolute path table for @p directory.
         * Paths are absolute whatever `relative` says.
         */
        Result<SymbolMap, Error> generate_table(const fs::path& directory, const Options& options);

        /**
         * Standalone PHP loader for @p directory.
         */
        Result<std::string, Error> render_source(const fs::path& directory, const Options& options);

        /**
         * JSON data table for @p directory.
         */
        Result<std::string, Error> render_json(const fs::path& directory, const Options& options);

        /**
         * One entry per successful activate(), in activation order.
         */
        [[nodiscard]] std::vector<LoaderInfo> list_active() const;

        /**
         * Empties the scan cache. Active loaders keep their maps.
         */
        void clear_cache() noexcept;

        /**
         * Unregisters every resolver this façade registered.
         *
         * @return How many the host actually removed. A resolver the host
         *         already dropped is not counted.
         */
        std::size_t unregister_all();

        void set_warning_sink(WarningSink sink) {
            sink_ = std::move(sink);
        }

    private:
        struct LoaderRecord {
            fs::path directory;
            ResolverHandle resolver;
            ClassMap map;
        };

        Result<void, Error> check_host();
        Result<ClassMap, Error> build_non_empty(const fs::path& directory, const Options& options);
        Error warn(Error error) const;

        IHostLoader& host_;
        MappingBuilder& builder_;
        std::vector<LoaderRecord> records_;
        bool host_checked_ = false;
        WarningSink sink_ = stderr_warning_sink();
    };

}  // namespace classmap::loader

#endif //CLASSMAP_AUTOLOADER_HPP
