//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CLASSMAP_LEXER_HPP
#define CLASSMAP_LEXER_HPP

/**
 * @file lexer.hpp
 * @brief Tolerant PHP lexer.
 *
 * The lexer follows the PHP scanner closely enough to find declaration
 * syntax, and no further: string interpolation is not tokenized, numbers
 * are not validated, and an unterminated comment or literal simply runs
 * to the end of the input.
 *
 * Two rules are context sensitive, as in PHP itself:
 * - a label after `->` or `?->` is always an Identifier;
 * - `enum` is a keyword only when followed by whitespace or comments and a
 *   label other than `extends` / `implements`.
 */

#include "classmap/scanner/token.hpp"
#include "classmap/diagnostics.hpp"
#include "classmap/error.hpp"
#include "classmap/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace classmap::scanner {

    namespace fs = std::filesystem;

    class Lexer {
    public:
        explicit Lexer(std::string_view source) noexcept;

        /**
         * Tokenizes the whole source.
         *
         * @return The token sequence, or ParseError for input that cannot be
         *         PHP source at all (a NUL byte inside a code region).
         */
        Result<std::vector<Token>, Error> tokenize();

    private:
        [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
        [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept;
        [[nodiscard]] bool starts_with(std::string_view s) const noexcept;
        [[nodiscard]] bool starts_with_icase(std::string_view s) const noexcept;

        void emit(TokenKind kind, std::size_t start);

        void lex_inline_html();
        void lex_php_token();

        void lex_whitespace();
        void lex_line_comment(std::size_t start);
        void lex_block_comment(std::size_t start);
        void lex_label(std::size_t start);
        void lex_fully_qualified_or_separator(std::size_t start);
        void lex_number(std::size_t start);
        void lex_quoted(std::size_t start, char quote);
        bool lex_heredoc(std::size_t start);
        void lex_operator(std::size_t start);

        std::size_t read_label_end(std::size_t from) const noexcept;
        [[nodiscard]] bool enum_is_keyword(std::size_t after) const noexcept;
        [[nodiscard]] bool after_member_access() const noexcept;

        std::string_view src_;
        std::size_t pos_ = 0;
        std::size_t line_ = 1;
        bool in_php_ = false;
        std::vector<Token> tokens_;
    };

    /**
     * Tokenizes @p source, turning a ParseError into an empty sequence.
     *
     * The failure is reported to @p sink with the file path as context, and
     * the caller sees a file without tokens, hence without symbols.
     */
    std::vector<Token> tokenize_or_empty(std::string_view source,
                                         const fs::path& file,
                                         const WarningSink& sink);

}  // namespace classmap::scanner

#endif //CLASSMAP_LEXER_HPP
