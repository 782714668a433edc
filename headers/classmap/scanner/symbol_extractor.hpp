//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CLASSMAP_SYMBOL_EXTRACTOR_HPP
#define CLASSMAP_SYMBOL_EXTRACTOR_HPP

/**
 * @file symbol_extractor.hpp
 * @brief Finds the named type declarations of one PHP file.
 *
 * The extractor is a single forward pass over the token stream. It keeps
 * track of:
 * - the current namespace, for both `namespace X;` and `namespace X { }`;
 * - the brace depth, to notice when a bracketed namespace closes;
 * - whether it is inside a class-like body, where `use` imports traits
 *   instead of names;
 * - the alias table built from `use` statements.
 *
 * A declaration keyword is skipped when the token before it is `new`
 * (anonymous class) or `::` (`Foo::class`). Otherwise the next
 * significant token must be an identifier, which becomes the simple name.
 *
 * @code
 *     SymbolExtractor extractor;
 *     auto symbols = extractor.extract_source("<?php namespace App; class Kernel {}");
 *     // symbols.declarations == {"App\\Kernel"}
 * @endcode
 */

#include "classmap/scanner/token.hpp"
#include "classmap/diagnostics.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace classmap::scanner {

    namespace fs = std::filesystem;

    enum class ImportKind {
        Type,
        Function,
        Constant
    };

    /**
     * One name imported by a `use` statement.
     */
    struct Import {
        std::string namespace_name;  // Namespace the statement appeared in
        std::string alias;           // Local name
        std::string target;          // Fully-qualified name, no leading separator
        ImportKind kind = ImportKind::Type;
    };

    /**
     * Everything extracted from one file.
     */
    struct FileSymbols {
        std::vector<std::string> declarations;  // Fully-qualified, first occurrence order
        std::vector<Import> imports;

        [[nodiscard]] bool empty() const noexcept {
            return declarations.empty();
        }
    };

    class SymbolExtractor {
    public:
        /**
         * Extracts the declarations and imports of one token stream.
         * State from a previous call is discarded.
         */
        [[nodiscard]] FileSymbols extract(const std::vector<Token>& tokens);

        /**
         * Tokenizes @p content tolerantly and extracts from the result.
         */
        [[nodiscard]] FileSymbols extract_source(std::string_view content,
                                                 const fs::path& file = {},
                                                 const WarningSink& sink = {});

        /**
         * Alias table in effect at the end of the last extraction.
         */
        [[nodiscard]] const std::unordered_map<std::string, std::string>& aliases() const noexcept {
            return aliases_;
        }

    private:
        void reset();
        void open_brace();
        void close_brace();

        std::size_t handle_namespace(const std::vector<Token>& tokens, std::size_t pos);
        std::size_t handle_use(const std::vector<Token>& tokens, std::size_t pos);
        void handle_declaration(const std::vector<Token>& tokens, std::size_t pos);

        std::size_t read_use_clause(const std::vector<Token>& tokens, std::size_t pos,
                                    const std::string& prefix, ImportKind kind);
        void add_import(std::string target, std::string alias, ImportKind kind);
        void add_declaration(const std::string& name);

        [[nodiscard]] bool in_declaration_body() const noexcept {
            return declaration_body_depth_ > 0;
        }

        std::string namespace_;
        int namespace_scope_depth_ = 0;   // 0 when no bracketed namespace is open
        int brace_depth_ = 0;
        bool declaration_pending_ = false;
        int declaration_body_depth_ = 0;  // 0 when outside any class-like body
        std::unordered_map<std::string, std::string> aliases_;

        FileSymbols result_;
        std::unordered_set<std::string> seen_;
    };

    /**
     * Index of the first non-trivia token at or after @p pos, or tokens.size().
     */
    std::size_t skip_trivia(const std::vector<Token>& tokens, std::size_t pos) noexcept;

    /**
     * The nearest non-trivia token before @p pos, or nullptr.
     */
    const Token* previous_significant(const std::vector<Token>& tokens, std::size_t pos) noexcept;

}  // namespace classmap::scanner

#endif //CLASSMAP_SYMBOL_EXTRACTOR_HPP
