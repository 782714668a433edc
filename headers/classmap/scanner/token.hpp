//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CLASSMAP_TOKEN_HPP
#define CLASSMAP_TOKEN_HPP

/**
 * @file token.hpp
 * @brief PHP lexical tokens.
 *
 * Only the token kinds the scanner reasons about get their own kind.
 * Reserved words that never start a declaration, import or namespace
 * statement (`if`, `return`, `abstract`, ...) are plain Identifiers.
 * Single structural characters (`{ } ; ( ) , [ ] =` ...) are opaque
 * Char tokens that carry only their text.
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace classmap::scanner {

    enum class TokenKind {
        // Outside <?php ... ?>
        InlineHtml,
        OpenTag,            // <?php
        OpenTagWithEcho,    // <?=
        CloseTag,           // ?>

        // Trivia
        Whitespace,
        Comment,            // //, # and /* */
        DocComment,         // /** */

        AttributeStart,     // #[
        Variable,           // $name
        Identifier,
        NameQualified,      // A\B
        NameFullyQualified, // \A\B
        NameRelative,       // namespace\A
        NsSeparator,        // lone backslash
        Number,
        String,             // quoted, backtick, heredoc and nowdoc literals

        // Keywords (matched case-insensitively)
        Namespace,
        Use,
        As,
        Class,
        Interface,
        Trait,
        Enum,
        New,
        Function,
        Const,
        Declare,

        DoubleColon,            // ::
        ObjectOperator,         // ->
        NullsafeObjectOperator, // ?->
        Operator,               // any other multi-character operator

        Char
    };

    /**
     * Human-readable kind name, for diagnostics and test output.
     */
    inline const char* token_kind_name(const TokenKind kind) noexcept {
        switch (kind) {
            case TokenKind::InlineHtml:             return "InlineHtml";
            case TokenKind::OpenTag:                return "OpenTag";
            case TokenKind::OpenTagWithEcho:        return "OpenTagWithEcho";
            case TokenKind::CloseTag:               return "CloseTag";
            case TokenKind::Whitespace:             return "Whitespace";
            case TokenKind::Comment:                return "Comment";
            case TokenKind::DocComment:             return "DocComment";
            case TokenKind::AttributeStart:         return "AttributeStart";
            case TokenKind::Variable:               return "Variable";
            case TokenKind::Identifier:             return "Identifier";
            case TokenKind::NameQualified:          return "NameQualified";
            case TokenKind::NameFullyQualified:     return "NameFullyQualified";
            case TokenKind::NameRelative:           return "NameRelative";
            case TokenKind::NsSeparator:            return "NsSeparator";
            case TokenKind::Number:                 return "Number";
            case TokenKind::String:                 return "String";
            case TokenKind::Namespace:              return "Namespace";
            case TokenKind::Use:                    return "Use";
            case TokenKind::As:                     return "As";
            case TokenKind::Class:                  return "Class";
            case TokenKind::Interface:              return "Interface";
            case TokenKind::Trait:                  return "Trait";
            case TokenKind::Enum:                   return "Enum";
            case TokenKind::New:                    return "New";
            case TokenKind::Function:               return "Function";
            case TokenKind::Const:                  return "Const";
            case TokenKind::Declare:                return "Declare";
            case TokenKind::DoubleColon:            return "DoubleColon";
            case TokenKind::ObjectOperator:         return "ObjectOperator";
            case TokenKind::NullsafeObjectOperator: return "NullsafeObjectOperator";
            case TokenKind::Operator:               return "Operator";
            case TokenKind::Char:                   return "Char";
        }
        return "Unknown";
    }

    struct Token {
        TokenKind kind = TokenKind::Char;
        std::string text;
        std::size_t line = 1;    // 1-based line of the first character
        std::size_t offset = 0;  // Byte offset into the source

        /**
         * Whitespace and comments. Doc comments count as trivia too.
         */
        [[nodiscard]] bool is_trivia() const noexcept {
            return kind == TokenKind::Whitespace ||
                   kind == TokenKind::Comment ||
                   kind == TokenKind::DocComment;
        }

        [[nodiscard]] bool is_opaque() const noexcept {
            return kind == TokenKind::Char;
        }

        /**
         * True for the opaque single-character token @p c.
         */
        [[nodiscard]] bool is_char(const char c) const noexcept {
            return kind == TokenKind::Char && text.size() == 1 && text.front() == c;
        }

        /**
         * Declaration-kind keywords: class, interface, trait, enum.
         */
        [[nodiscard]] bool is_declaration_keyword() const noexcept {
            return kind == TokenKind::Class ||
                   kind == TokenKind::Interface ||
                   kind == TokenKind::Trait ||
                   kind == TokenKind::Enum;
        }

        /**
         * Tokens that can make up a (possibly qualified) name.
         */
        [[nodiscard]] bool is_name_part() const noexcept {
            return kind == TokenKind::Identifier ||
                   kind == TokenKind::NameQualified ||
                   kind == TokenKind::NameFullyQualified ||
                   kind == TokenKind::NsSeparator;
        }
    };

}  // namespace classmap::scanner

#endif //CLASSMAP_TOKEN_HPP
