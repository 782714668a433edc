//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CLASSMAP_HOST_HPP
#define CLASSMAP_HOST_HPP

/**
 * @file host.hpp
 * @brief Interface to the runtime that loads classes on demand.
 *
 * The host keeps an ordered list of resolvers. When an unknown identifier
 * is referenced it asks each resolver in turn until one of them loads a
 * file that defines it. In PHP this is the spl_autoload stack;
 * ResolverChain is the in-process implementation used by the CLI and the
 * tests.
 */

#include <filesystem>
#include <memory>
#include <string_view>

namespace classmap::loader {

    namespace fs = std::filesystem;

    /**
     * Something that can try to satisfy an identifier lookup.
     */
    class Resolver {
    public:
        virtual ~Resolver() = default;

        /**
         * Attempts to load the definition of @p identifier.
         *
         * @return True if a defining file was loaded. Never throws.
         */
        virtual bool resolve(std::string_view identifier) = 0;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    };

    /**
     * Registration handle. Hosts compare handles by identity, so the handle
     * passed to register_resolver() is the one to pass back for removal.
     */
    using ResolverHandle = std::shared_ptr<Resolver>;

    class IHostLoader {
    public:
        virtual ~IHostLoader() = default;

        /**
         * Revision of this interface the host implements.
         * See MIN_HOST_CAPABILITY.
         */
        [[nodiscard]] virtual int capability_version() const noexcept = 0;

        /**
         * Adds a resolver at the front (@p prepend) or back of the chain.
         *
         * @return False if the host rejects the resolver.
         */
        virtual bool register_resolver(const ResolverHandle& resolver, bool prepend) = 0;

        /**
         * Removes a previously registered resolver.
         *
         * @return False if the handle is not (or no longer) registered.
         */
        virtual bool unregister_resolver(const ResolverHandle& resolver) = 0;

        /**
         * Loads a source file unless it was loaded before.
         *
         * @return True if the file is loaded after the call.
         */
        virtual bool include_once(const fs::path& file) = 0;
    };

}  // namespace classmap::loader

#endif //CLASSMAP_HOST_HPP
