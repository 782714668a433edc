//
// Created by gregorian-rayne on 2/10/26.
//

#include "classmap/scanner/static_classifier.hpp"

namespace classmap::scanner {

    namespace {

        /**
         * Skips past the first ';' or '{' at or after @p pos.
         */
        std::size_t skip_statement_head(const std::vector<Token>& tokens, std::size_t pos) {
            while (pos < tokens.size()) {
                const Token& token = tokens[pos++];
                if (token.is_char(';') || token.is_char('{')) {
                    break;
                }
            }
            return pos;
        }

        /**
         * Skips past the next ';'. Group imports keep their braces inside.
         */
        std::size_t skip_statement(const std::vector<Token>& tokens, std::size_t pos) {
            while (pos < tokens.size()) {
                if (tokens[pos++].is_char(';')) {
                    break;
                }
            }
            return pos;
        }

        /**
         * Skips a declare(...) directive and its ';' if there is one.
         * A declare block's braces are left to the caller.
         */
        std::size_t skip_declare(const std::vector<Token>& tokens, std::size_t pos) {
            int parens = 0;
            while (pos < tokens.size()) {
                const Token& token = tokens[pos++];
                if (token.is_char('(')) {
                    ++parens;
                } else if (token.is_char(')') && --parens <= 0) {
                    break;
                }
            }
            pos = skip_trivia(tokens, pos);
            if (pos < tokens.size() && tokens[pos].is_char(';')) {
                ++pos;
            }
            return pos;
        }

    }  // namespace

    FileKind StaticFileClassifier::classify(const std::vector<Token>& tokens, const FileSymbols& symbols) const {
        if (!symbols.declarations.empty()) {
            return FileKind::Declarations;
        }
        return has_executable_content(tokens) ? FileKind::Static : FileKind::Empty;
    }

    bool StaticFileClassifier::has_executable_content(const std::vector<Token>& tokens) {
        std::size_t i = 0;
        while (i < tokens.size()) {
            const Token& token = tokens[i];
            switch (token.kind) {
                case TokenKind::InlineHtml:
                case TokenKind::OpenTag:
                case TokenKind::CloseTag:
                case TokenKind::Whitespace:
                case TokenKind::Comment:
                case TokenKind::DocComment:
                    ++i;
                    break;

                case TokenKind::Namespace:
                    i = skip_statement_head(tokens, i + 1);
                    break;

                case TokenKind::Use:
                    i = skip_statement(tokens, i + 1);
                    break;

                case TokenKind::Declare:
                    i = skip_declare(tokens, i + 1);
                    break;

                case TokenKind::Char:
                    // Namespace block braces and empty statements
                    if (token.is_char(';') || token.is_char('{') || token.is_char('}')) {
                        ++i;
                        break;
                    }
                    return true;

                default:
                    return true;
            }
        }
        return false;
    }

}  // namespace classmap::scanner
