//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CLASSMAP_MAPPING_RESOLVER_HPP
#define CLASSMAP_MAPPING_RESOLVER_HPP

/**
 * @file mapping_resolver.hpp
 * @brief Resolver backed by one class map.
 */

#include "classmap/loader/host.hpp"
#include "classmap/diagnostics.hpp"
#include "classmap/types.hpp"

#include <filesystem>
#include <string_view>

namespace classmap::loader {

    class MappingResolver : public Resolver {
    public:
        /**
         * @param host Loads the files this resolver finds. Must outlive it.
         * @param symbols Identifier to file table.
         * @param case_sensitive Exact lookup when true, ASCII case folding otherwise.
         */
        MappingResolver(IHostLoader& host, SymbolMap symbols, bool case_sensitive,
                        WarningSink sink = stderr_warning_sink());

        /**
         * Looks the identifier up and asks the host to include the file.
         * A missing entry or an unreadable file is a plain `false`.
         */
        bool resolve(std::string_view identifier) override;

        [[nodiscard]] std::string_view name() const noexcept override {
            return "classmap";
        }

        /**
         * The file @p identifier maps to under this resolver's lookup rule,
         * or nullptr. With case folding the first matching entry wins.
         */
        [[nodiscard]] const fs::path* locate(std::string_view identifier) const;

        [[nodiscard]] const SymbolMap& symbols() const noexcept { return symbols_; }
        [[nodiscard]] bool case_sensitive() const noexcept { return case_sensitive_; }

    private:
        IHostLoader& host_;
        SymbolMap symbols_;
        bool case_sensitive_;
        WarningSink sink_;
    };

}  // namespace classmap::loader

#endif //CLASSMAP_MAPPING_RESOLVER_HPP
