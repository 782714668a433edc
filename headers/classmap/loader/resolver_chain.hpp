//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CLASSMAP_RESOLVER_CHAIN_HPP
#define CLASSMAP_RESOLVER_CHAIN_HPP

/**
 * @file resolver_chain.hpp
 * @brief In-process host loader.
 *
 * ResolverChain keeps resolvers in registration order and remembers which
 * files were included. "Including" a file means recording it; an optional
 * FileLoadHook lets the embedder do real work (evaluate the file, hand it
 * to an interpreter) the first time a file is included.
 */

#include "classmap/loader/host.hpp"
#include "classmap/version.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace classmap::loader {

    /**
     * Called once per file on first inclusion. Returning false marks the
     * load as failed and leaves the file not included.
     */
    using FileLoadHook = std::function<bool(const fs::path&)>;

    class ResolverChain : public IHostLoader {
    public:
        explicit ResolverChain(int capability = MIN_HOST_CAPABILITY);

        /**
         * Process-wide chain used by Autoloader::instance().
         */
        static ResolverChain& instance();

        [[nodiscard]] int capability_version() const noexcept override {
            return capability_;
        }

        /**
         * Rejects null handles and handles that are already registered.
         */
        bool register_resolver(const ResolverHandle& resolver, bool prepend) override;

        bool unregister_resolver(const ResolverHandle& resolver) override;

        /**
         * Records @p file (canonicalized) as included. A second call for the
         * same file returns true without loading again.
         */
        bool include_once(const fs::path& file) override;

        /**
         * Asks every resolver in order until one succeeds.
         *
         * @return True if some resolver loaded a file for @p identifier.
         */
        bool resolve(std::string_view identifier);

        [[nodiscard]] bool contains(const ResolverHandle& resolver) const;

        [[nodiscard]] std::size_t size() const noexcept {
            return resolvers_.size();
        }

        [[nodiscard]] const std::vector<ResolverHandle>& resolvers() const noexcept {
            return resolvers_;
        }

        /**
         * Files included so far, in inclusion order.
         */
        [[nodiscard]] const std::vector<fs::path>& included_files() const noexcept {
            return included_order_;
        }

        [[nodiscard]] bool is_included(const fs::path& file) const;

        void set_file_load_hook(FileLoadHook hook) {
            hook_ = std::move(hook);
        }

        /**
         * Forgets every resolver and included file.
         */
        void clear();

    private:
        int capability_;
        std::vector<ResolverHandle> resolvers_;
        std::unordered_set<std::string> included_;
        std::vector<fs::path> included_order_;
        FileLoadHook hook_;
    };

}  // namespace classmap::loader

#endif //CLASSMAP_RESOLVER_CHAIN_HPP
