//
// Created by gregorian-rayne on 2/10/26.
//

#include "classmap/scanner/lexer.hpp"
#include "classmap/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace classmap::scanner {

    namespace {

        bool is_label_start(const char ch) noexcept {
            const auto c = static_cast<unsigned char>(ch);
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
        }

        bool is_digit(const char c) noexcept {
            return c >= '0' && c <= '9';
        }

        bool is_label_char(const char c) noexcept {
            return is_label_start(c) || is_digit(c);
        }

        bool is_space(const char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        TokenKind keyword_kind(const std::string& lowered) noexcept {
            if (lowered == "namespace") return TokenKind::Namespace;
            if (lowered == "use")       return TokenKind::Use;
            if (lowered == "as")        return TokenKind::As;
            if (lowered == "class")     return TokenKind::Class;
            if (lowered == "interface") return TokenKind::Interface;
            if (lowered == "trait")     return TokenKind::Trait;
            if (lowered == "enum")      return TokenKind::Enum;
            if (lowered == "new")       return TokenKind::New;
            if (lowered == "function")  return TokenKind::Function;
            if (lowered == "const")     return TokenKind::Const;
            if (lowered == "declare")   return TokenKind::Declare;
            return TokenKind::Identifier;
        }

        // Longest first, so "?->" wins over "??" and "**=" over "**".
        constexpr std::array<std::string_view, 35> kOperators = {
            "?->", "**=", "...", "<=>", "===", "!==", "<<=", ">>=", "??=",
            "::", "->", "=>", "==", "!=", "<>", "<=", ">=", "&&", "||",
            "??", "++", "--", "+=", "-=", "*=", "/=", ".=", "%=", "&=",
            "|=", "^=", "<<", ">>", "**", "|>"
        };

    }  // namespace

    Lexer::Lexer(const std::string_view source) noexcept
        : src_(source) {}

    char Lexer::peek(const std::size_t ahead) const noexcept {
        const std::size_t at = pos_ + ahead;
        return at < src_.size() ? src_[at] : '\0';
    }

    bool Lexer::starts_with(const std::string_view s) const noexcept {
        return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
    }

    bool Lexer::starts_with_icase(const std::string_view s) const noexcept {
        return src_.size() >= pos_ + s.size() && string_utils::iequals(src_.substr(pos_, s.size()), s);
    }

    std::size_t Lexer::read_label_end(std::size_t from) const noexcept {
        while (from < src_.size() && is_label_char(src_[from])) {
            ++from;
        }
        return from;
    }

    void Lexer::emit(const TokenKind kind, const std::size_t start) {
        Token token;
        token.kind = kind;
        token.text = std::string(src_.substr(start, pos_ - start));
        token.line = line_;
        token.offset = start;
        line_ += static_cast<std::size_t>(std::ranges::count(token.text, '\n'));
        tokens_.push_back(std::move(token));
    }

    Result<std::vector<Token>, Error> Lexer::tokenize() {
        tokens_.clear();
        pos_ = 0;
        line_ = 1;
        in_php_ = false;

        while (!eof()) {
            if (!in_php_) {
                lex_inline_html();
                continue;
            }
            if (src_[pos_] == '\0') {
                return Result<std::vector<Token>, Error>::failure(
                    Error::parse_error("Unexpected NUL byte in PHP code", "line " + std::to_string(line_))
                );
            }
            lex_php_token();
        }

        return Result<std::vector<Token>, Error>::success(std::move(tokens_));
    }

    void Lexer::lex_inline_html() {
        const std::size_t start = pos_;
        while (!eof()) {
            if (starts_with("<?=")) {
                break;
            }
            if (starts_with_icase("<?php") && (pos_ + 5 >= src_.size() || is_space(src_[pos_ + 5]))) {
                break;
            }
            ++pos_;
        }

        if (pos_ > start) {
            emit(TokenKind::InlineHtml, start);
        }
        if (eof()) {
            return;
        }

        const std::size_t tag_start = pos_;
        if (starts_with("<?=")) {
            pos_ += 3;
            emit(TokenKind::OpenTagWithEcho, tag_start);
        } else {
            pos_ += 5;
            // The open tag swallows exactly one following newline or blank.
            if (starts_with("\r\n")) {
                pos_ += 2;
            } else if (!eof()) {
                ++pos_;
            }
            emit(TokenKind::OpenTag, tag_start);
        }
        in_php_ = true;
    }

    void Lexer::lex_php_token() {
        const std::size_t start = pos_;
        const char c = peek();

        if (is_space(c)) {
            lex_whitespace();
            emit(TokenKind::Whitespace, start);
            return;
        }

        if (starts_with("?>")) {
            pos_ += 2;
            if (starts_with("\r\n")) {
                pos_ += 2;
            } else if (peek() == '\n') {
                ++pos_;
            }
            emit(TokenKind::CloseTag, start);
            in_php_ = false;
            return;
        }

        if (starts_with("#[")) {
            pos_ += 2;
            emit(TokenKind::AttributeStart, start);
            return;
        }

        if (c == '#' || starts_with("//")) {
            lex_line_comment(start);
            return;
        }

        if (starts_with("/*")) {
            lex_block_comment(start);
            return;
        }

        if (c == '$' && is_label_start(peek(1))) {
            pos_ = read_label_end(pos_ + 1);
            emit(TokenKind::Variable, start);
            return;
        }

        if (is_label_start(c)) {
            lex_label(start);
            return;
        }

        if (c == '\\') {
            lex_fully_qualified_or_separator(start);
            return;
        }

        if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
            lex_number(start);
            return;
        }

        if (c == '\'' || c == '"' || c == '`') {
            lex_quoted(start, c);
            return;
        }

        if (starts_with("<<<") && lex_heredoc(start)) {
            return;
        }

        lex_operator(start);
    }

    void Lexer::lex_whitespace() {
        while (!eof() && is_space(peek())) {
            ++pos_;
        }
    }

    void Lexer::lex_line_comment(const std::size_t start) {
        while (!eof()) {
            if (peek() == '\n') {
                ++pos_;
                break;
            }
            // A close tag ends a single-line comment and stays a token.
            if (starts_with("?>")) {
                break;
            }
            ++pos_;
        }
        emit(TokenKind::Comment, start);
    }

    void Lexer::lex_block_comment(const std::size_t start) {
        const bool is_doc = starts_with("/**") && is_space(peek(3));
        const std::size_t close = src_.find("*/", pos_ + 2);
        pos_ = close == std::string_view::npos ? src_.size() : close + 2;
        emit(is_doc ? TokenKind::DocComment : TokenKind::Comment, start);
    }

    void Lexer::lex_label(const std::size_t start) {
        const std::size_t first_end = read_label_end(pos_);
        std::size_t end = first_end;
        bool qualified = false;

        while (end + 1 < src_.size() && src_[end] == '\\' && is_label_start(src_[end + 1])) {
            end = read_label_end(end + 1);
            qualified = true;
        }

        const std::string_view first = src_.substr(start, first_end - start);
        pos_ = end;

        if (qualified) {
            emit(string_utils::iequals(first, "namespace") ? TokenKind::NameRelative : TokenKind::NameQualified,
                 start);
            return;
        }

        if (after_member_access()) {
            emit(TokenKind::Identifier, start);
            return;
        }

        TokenKind kind = keyword_kind(string_utils::to_lower(first));
        if (kind == TokenKind::Enum && !enum_is_keyword(pos_)) {
            kind = TokenKind::Identifier;
        }
        emit(kind, start);
    }

    void Lexer::lex_fully_qualified_or_separator(const std::size_t start) {
        if (!is_label_start(peek(1))) {
            ++pos_;
            emit(TokenKind::NsSeparator, start);
            return;
        }

        pos_ = read_label_end(pos_ + 1);
        while (pos_ + 1 < src_.size() && src_[pos_] == '\\' && is_label_start(src_[pos_ + 1])) {
            pos_ = read_label_end(pos_ + 1);
        }
        emit(TokenKind::NameFullyQualified, start);
    }

    void Lexer::lex_number(const std::size_t start) {
        ++pos_;
        while (!eof()) {
            const char c = peek();
            if (is_label_char(c)) {
                ++pos_;
                continue;
            }
            if (c == '.' && is_digit(peek(1))) {
                ++pos_;
                continue;
            }
            // Signed exponent: 1e-5, 2.5E+3
            if ((c == '+' || c == '-') && (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E') && is_digit(peek(1))) {
                ++pos_;
                continue;
            }
            break;
        }
        emit(TokenKind::Number, start);
    }

    void Lexer::lex_quoted(const std::size_t start, const char quote) {
        ++pos_;
        while (!eof()) {
            const char c = peek();
            if (c == '\\') {
                pos_ = std::min(pos_ + 2, src_.size());
                continue;
            }
            ++pos_;
            if (c == quote) {
                break;
            }
        }
        emit(TokenKind::String, start);
    }

    bool Lexer::lex_heredoc(const std::size_t start) {
        std::size_t i = pos_ + 3;
        while (i < src_.size() && (src_[i] == ' ' || src_[i] == '\t')) {
            ++i;
        }

        char quote = '\0';
        if (i < src_.size() && (src_[i] == '\'' || src_[i] == '"')) {
            quote = src_[i];
            ++i;
        }

        if (i >= src_.size() || !is_label_start(src_[i])) {
            return false;
        }
        const std::size_t label_end = read_label_end(i);
        const std::string_view label = src_.substr(i, label_end - i);
        i = label_end;

        if (quote != '\0') {
            if (i >= src_.size() || src_[i] != quote) {
                return false;
            }
            ++i;
        }
        if (i < src_.size() && src_[i] == '\r') {
            ++i;
        }
        if (i >= src_.size() || src_[i] != '\n') {
            return false;
        }
        ++i;

        // Closing marker: optional indentation, the label, then a non-label character.
        std::size_t line_start = i;
        while (line_start < src_.size()) {
            std::size_t j = line_start;
            while (j < src_.size() && (src_[j] == ' ' || src_[j] == '\t')) {
                ++j;
            }
            const std::size_t marker_end = j + label.size();
            if (src_.substr(j, label.size()) == label &&
                (marker_end >= src_.size() || !is_label_char(src_[marker_end]))) {
                pos_ = marker_end;
                emit(TokenKind::String, start);
                return true;
            }

            const std::size_t newline = src_.find('\n', line_start);
            if (newline == std::string_view::npos) {
                break;
            }
            line_start = newline + 1;
        }

        pos_ = src_.size();
        emit(TokenKind::String, start);
        return true;
    }

    void Lexer::lex_operator(const std::size_t start) {
        for (const auto op : kOperators) {
            if (!starts_with(op)) {
                continue;
            }
            pos_ += op.size();
            TokenKind kind = TokenKind::Operator;
            if (op == "::") {
                kind = TokenKind::DoubleColon;
            } else if (op == "->") {
                kind = TokenKind::ObjectOperator;
            } else if (op == "?->") {
                kind = TokenKind::NullsafeObjectOperator;
            }
            emit(kind, start);
            return;
        }

        ++pos_;
        emit(TokenKind::Char, start);
    }

    bool Lexer::enum_is_keyword(std::size_t after) const noexcept {
        bool separated = false;
        while (after < src_.size()) {
            const char c = src_[after];
            if (is_space(c)) {
                ++after;
                separated = true;
            } else if (src_.substr(after, 2) == "/*") {
                const std::size_t close = src_.find("*/", after + 2);
                after = close == std::string_view::npos ? src_.size() : close + 2;
                separated = true;
            } else if ((c == '#' && src_.substr(after, 2) != "#[") || src_.substr(after, 2) == "//") {
                const std::size_t newline = src_.find('\n', after);
                after = newline == std::string_view::npos ? src_.size() : newline + 1;
                separated = true;
            } else {
                break;
            }
        }

        if (!separated || after >= src_.size() || !is_label_start(src_[after])) {
            return false;
        }
        const std::string_view next = src_.substr(after, read_label_end(after) - after);
        return !string_utils::iequals(next, "extends") && !string_utils::iequals(next, "implements");
    }

    bool Lexer::after_member_access() const noexcept {
        for (auto it = tokens_.rbegin(); it != tokens_.rend(); ++it) {
            if (it->is_trivia()) {
                continue;
            }
            return it->kind == TokenKind::ObjectOperator || it->kind == TokenKind::NullsafeObjectOperator;
        }
        return false;
    }

    std::vector<Token> tokenize_or_empty(const std::string_view source,
                                         const fs::path& file,
                                         const WarningSink& sink) {
        Lexer lexer(source);
        auto tokens = lexer.tokenize();
        if (tokens.is_err()) {
            report_warning(sink, tokens.error().with_context(file.string()));
            return {};
        }
        return std::move(tokens).value();
    }

}  // namespace classmap::scanner
