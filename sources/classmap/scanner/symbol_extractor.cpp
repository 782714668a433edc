//
// Created by gregorian-rayne on 2/10/26.
//

#include "classmap/scanner/symbol_extractor.hpp"
#include "classmap/scanner/lexer.hpp"
#include "classmap/utils/string_utils.hpp"

#include <algorithm>

namespace classmap::scanner {

    namespace {

        std::string last_segment(const std::string_view name) {
            const auto sep = name.rfind('\\');
            return std::string(sep == std::string_view::npos ? name : name.substr(sep + 1));
        }

    }  // namespace

    std::size_t skip_trivia(const std::vector<Token>& tokens, std::size_t pos) noexcept {
        while (pos < tokens.size() && tokens[pos].is_trivia()) {
            ++pos;
        }
        return pos;
    }

    const Token* previous_significant(const std::vector<Token>& tokens, std::size_t pos) noexcept {
        while (pos > 0) {
            --pos;
            if (!tokens[pos].is_trivia()) {
                return &tokens[pos];
            }
        }
        return nullptr;
    }

    FileSymbols SymbolExtractor::extract(const std::vector<Token>& tokens) {
        reset();

        std::size_t i = 0;
        while (i < tokens.size()) {
            const Token& token = tokens[i];

            if (token.is_char('{')) {
                open_brace();
                ++i;
                continue;
            }
            if (token.is_char('}')) {
                close_brace();
                ++i;
                continue;
            }

            switch (token.kind) {
                case TokenKind::Namespace:
                    i = handle_namespace(tokens, i);
                    continue;
                case TokenKind::Use:
                    i = handle_use(tokens, i);
                    continue;
                case TokenKind::Class:
                case TokenKind::Interface:
                case TokenKind::Trait:
                case TokenKind::Enum:
                    handle_declaration(tokens, i);
                    break;
                default:
                    break;
            }
            ++i;
        }

        return std::move(result_);
    }

    FileSymbols SymbolExtractor::extract_source(const std::string_view content,
                                                const fs::path& file,
                                                const WarningSink& sink) {
        const auto tokens = tokenize_or_empty(content, file, sink);
        return extract(tokens);
    }

    void SymbolExtractor::reset() {
        namespace_.clear();
        namespace_scope_depth_ = 0;
        brace_depth_ = 0;
        declaration_pending_ = false;
        declaration_body_depth_ = 0;
        aliases_.clear();
        result_ = FileSymbols{};
        seen_.clear();
    }

    void SymbolExtractor::open_brace() {
        ++brace_depth_;
        if (declaration_pending_) {
            declaration_pending_ = false;
            if (declaration_body_depth_ == 0) {
                declaration_body_depth_ = brace_depth_;
            }
        }
    }

    void SymbolExtractor::close_brace() {
        // Stray closing braces in malformed files never go below zero.
        if (brace_depth_ > 0) {
            --brace_depth_;
        }

        if (declaration_body_depth_ > 0 && brace_depth_ < declaration_body_depth_) {
            declaration_body_depth_ = 0;
        }

        if (namespace_scope_depth_ > 0 && brace_depth_ < namespace_scope_depth_) {
            namespace_.clear();
            namespace_scope_depth_ = 0;
            aliases_.clear();
        }
    }

    std::size_t SymbolExtractor::handle_namespace(const std::vector<Token>& tokens, const std::size_t pos) {
        if (const Token* prev = previous_significant(tokens, pos); prev && prev->kind == TokenKind::DoubleColon) {
            return pos + 1;
        }

        std::string name;
        std::size_t i = pos + 1;
        while (i < tokens.size()) {
            const Token& token = tokens[i];
            if (token.is_trivia()) {
                ++i;
                continue;
            }
            if (!token.is_name_part()) {
                break;
            }
            name += token.text;
            ++i;
        }

        namespace_ = std::string(string_utils::trim_char(name, '\\'));
        aliases_.clear();
        namespace_scope_depth_ = (i < tokens.size() && tokens[i].is_char('{')) ? brace_depth_ + 1 : 0;

        // The terminator (';' or '{') goes back through the main loop.
        return i;
    }

    std::size_t SymbolExtractor::handle_use(const std::vector<Token>& tokens, const std::size_t pos) {
        if (in_declaration_body()) {
            return pos + 1;
        }
        if (const Token* prev = previous_significant(tokens, pos); prev && prev->kind == TokenKind::DoubleColon) {
            return pos + 1;
        }

        std::size_t i = skip_trivia(tokens, pos + 1);
        if (i < tokens.size() && tokens[i].is_char('(')) {
            return pos + 1;  // function () use ($x)
        }

        ImportKind kind = ImportKind::Type;
        if (i < tokens.size() && tokens[i].kind == TokenKind::Function) {
            kind = ImportKind::Function;
            i = skip_trivia(tokens, i + 1);
        } else if (i < tokens.size() && tokens[i].kind == TokenKind::Const) {
            kind = ImportKind::Constant;
            i = skip_trivia(tokens, i + 1);
        }

        while (i < tokens.size()) {
            i = skip_trivia(tokens, read_use_clause(tokens, i, "", kind));
            if (i < tokens.size() && tokens[i].is_char(',')) {
                ++i;
                continue;
            }
            break;
        }

        if (i < tokens.size() && tokens[i].is_char(';')) {
            ++i;
        }
        return std::max(i, pos + 1);
    }

    std::size_t SymbolExtractor::read_use_clause(const std::vector<Token>& tokens, const std::size_t pos,
                                                 const std::string& prefix, ImportKind kind) {
        std::size_t i = skip_trivia(tokens, pos);

        // Mixed groups: use A\{B, function c, const D};
        if (!prefix.empty() && i < tokens.size()) {
            if (tokens[i].kind == TokenKind::Function) {
                kind = ImportKind::Function;
                i = skip_trivia(tokens, i + 1);
            } else if (tokens[i].kind == TokenKind::Const) {
                kind = ImportKind::Constant;
                i = skip_trivia(tokens, i + 1);
            }
        }

        std::string name;
        while (i < tokens.size() && tokens[i].is_name_part()) {
            name += tokens[i].text;
            i = skip_trivia(tokens, i + 1);
        }

        if (prefix.empty() && i < tokens.size() && tokens[i].is_char('{')) {
            const std::string group_prefix(string_utils::trim_char(name, '\\'));
            ++i;
            while (i < tokens.size()) {
                i = skip_trivia(tokens, read_use_clause(tokens, i, group_prefix, kind));
                if (i < tokens.size() && tokens[i].is_char(',')) {
                    ++i;
                    continue;
                }
                break;
            }
            if (i < tokens.size() && tokens[i].is_char('}')) {
                ++i;
            }
            return i;
        }

        std::string target(string_utils::trim_char(name, '\\'));
        if (target.empty()) {
            return i;
        }
        if (!prefix.empty()) {
            target = prefix + "\\" + target;
        }

        std::string alias;
        if (i < tokens.size() && tokens[i].kind == TokenKind::As) {
            const std::size_t next = skip_trivia(tokens, i + 1);
            if (next < tokens.size() && tokens[next].kind == TokenKind::Identifier) {
                alias = tokens[next].text;
                i = next + 1;
            } else {
                i = next;
            }
        }
        if (alias.empty()) {
            alias = last_segment(target);
        }

        add_import(std::move(target), std::move(alias), kind);
        return i;
    }

    void SymbolExtractor::handle_declaration(const std::vector<Token>& tokens, const std::size_t pos) {
        if (const Token* prev = previous_significant(tokens, pos)) {
            if (prev->kind == TokenKind::New) {
                declaration_pending_ = true;  // anonymous class, its body still counts
                return;
            }
            if (prev->kind == TokenKind::DoubleColon) {
                return;  // Foo::class
            }
        }

        // A keyword without a name (const TRAIT = 1, foo(class: 1)) opens no body.
        const std::size_t next = skip_trivia(tokens, pos + 1);
        if (next >= tokens.size() || tokens[next].kind != TokenKind::Identifier) {
            return;
        }

        declaration_pending_ = true;
        if (in_declaration_body()) {
            return;
        }
        add_declaration(tokens[next].text);
    }

    void SymbolExtractor::add_import(std::string target, std::string alias, const ImportKind kind) {
        aliases_[alias] = target;
        result_.imports.push_back(Import{namespace_, std::move(alias), std::move(target), kind});
    }

    void SymbolExtractor::add_declaration(const std::string& name) {
        std::string qualified = namespace_.empty() ? name : namespace_ + "\\" + name;
        if (seen_.insert(qualified).second) {
            result_.declarations.push_back(std::move(qualified));
        }
    }

}  // namespace classmap::scanner
