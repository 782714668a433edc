//
// Created by gregorian-rayne on 2/11/26.
//

#include "classmap/loader/resolver_chain.hpp"
#include "classmap/utils/file_utils.hpp"

#include <algorithm>

namespace classmap::loader {

    namespace {

        fs::path normalized(const fs::path& file) {
            std::error_code ec;
            auto result = fs::weakly_canonical(file, ec);
            return ec ? file.lexically_normal() : result;
        }

    }  // namespace

    ResolverChain::ResolverChain(const int capability)
        : capability_(capability) {}

    ResolverChain& ResolverChain::instance() {
        static ResolverChain chain;
        return chain;
    }

    bool ResolverChain::register_resolver(const ResolverHandle& resolver, const bool prepend) {
        if (!resolver || contains(resolver)) {
            return false;
        }
        if (prepend) {
            resolvers_.insert(resolvers_.begin(), resolver);
        } else {
            resolvers_.push_back(resolver);
        }
        return true;
    }

    bool ResolverChain::unregister_resolver(const ResolverHandle& resolver) {
        const auto it = std::ranges::find(resolvers_, resolver);
        if (it == resolvers_.end()) {
            return false;
        }
        resolvers_.erase(it);
        return true;
    }

    bool ResolverChain::include_once(const fs::path& file) {
        const auto path = normalized(file);
        if (included_.contains(path.string())) {
            return true;
        }

        if (hook_) {
            if (!hook_(path)) {
                return false;
            }
        } else if (!file_utils::is_readable_file(path)) {
            return false;
        }

        included_.insert(path.string());
        included_order_.push_back(path);
        return true;
    }

    bool ResolverChain::resolve(const std::string_view identifier) {
        // A resolver may unregister itself while running; iterate over a copy.
        const auto snapshot = resolvers_;
        return std::ranges::any_of(snapshot, [identifier](const ResolverHandle& resolver) {
            return resolver->resolve(identifier);
        });
    }

    bool ResolverChain::contains(const ResolverHandle& resolver) const {
        return std::ranges::find(resolvers_, resolver) != resolvers_.end();
    }

    bool ResolverChain::is_included(const fs::path& file) const {
        return included_.contains(normalized(file).string());
    }

    void ResolverChain::clear() {
        resolvers_.clear();
        included_.clear();
        included_order_.clear();
    }

}  // namespace classmap::loader
