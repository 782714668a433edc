//
// Created by gregorian-rayne on 2/14/26.
//

#include "classmap/scanner/lexer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace classmap::scanner
{
    namespace {

        std::vector<Token> lex(const std::string_view source) {
            Lexer lexer(source);
            auto tokens = lexer.tokenize();
            EXPECT_TRUE(tokens.is_ok());
            return tokens.is_ok() ? std::move(tokens).value() : std::vector<Token>{};
        }

        std::vector<Token> significant(const std::vector<Token>& tokens) {
            std::vector<Token> result;
            for (const auto& token : tokens) {
                if (!token.is_trivia()) {
                    result.push_back(token);
                }
            }
            return result;
        }

        std::vector<TokenKind> kinds(const std::vector<Token>& tokens) {
            std::vector<TokenKind> result;
            for (const auto& token : tokens) {
                result.push_back(token.kind);
            }
            return result;
        }

    }  // namespace

    TEST(LexerTest, InlineHtmlOnly) {
        const auto tokens = lex("<html><body>no php here</body></html>");

        ASSERT_EQ(tokens.size(), 1u);
        EXPECT_EQ(tokens[0].kind, TokenKind::InlineHtml);
    }

    TEST(LexerTest, EmptySourceHasNoTokens) {
        EXPECT_TRUE(lex("").empty());
    }

    TEST(LexerTest, SimpleClassDeclaration) {
        const auto tokens = significant(lex("<?php\nclass Foo {}"));

        const std::vector<TokenKind> expected = {
            TokenKind::OpenTag, TokenKind::Class, TokenKind::Identifier, TokenKind::Char, TokenKind::Char
        };
        EXPECT_EQ(kinds(tokens), expected);
        EXPECT_EQ(tokens[0].text, "<?php\n");
        EXPECT_EQ(tokens[2].text, "Foo");
    }

    TEST(LexerTest, OpenTagRequiresWhitespaceOrEnd) {
        const auto tokens = lex("<?phpx class A {}");

        ASSERT_EQ(tokens.size(), 1u);
        EXPECT_EQ(tokens[0].kind, TokenKind::InlineHtml);

        const auto at_end = lex("<?php");
        ASSERT_EQ(at_end.size(), 1u);
        EXPECT_EQ(at_end[0].kind, TokenKind::OpenTag);
    }

    TEST(LexerTest, OpenTagIsCaseInsensitive) {
        const auto tokens = lex("<?PHP class A {}");

        ASSERT_FALSE(tokens.empty());
        EXPECT_EQ(tokens[0].kind, TokenKind::OpenTag);
    }

    TEST(LexerTest, EchoTagAndCloseTag) {
        const auto tokens = lex("<p><?= $title ?>\n</p>");

        const std::vector<TokenKind> expected = {
            TokenKind::InlineHtml, TokenKind::OpenTagWithEcho, TokenKind::Whitespace,
            TokenKind::Variable, TokenKind::Whitespace, TokenKind::CloseTag, TokenKind::InlineHtml
        };
        EXPECT_EQ(kinds(tokens), expected);
        EXPECT_EQ(tokens[5].text, "?>\n");
        EXPECT_EQ(tokens[6].text, "</p>");
    }

    TEST(LexerTest, KeywordsAreCaseInsensitive) {
        const auto tokens = significant(lex("<?php CLASS Foo {} Interface Bar {} TRAIT Baz {}"));

        EXPECT_EQ(tokens[1].kind, TokenKind::Class);
        EXPECT_EQ(tokens[5].kind, TokenKind::Interface);
        EXPECT_EQ(tokens[9].kind, TokenKind::Trait);
    }

    TEST(LexerTest, LabelAfterObjectOperatorIsIdentifier) {
        const auto tokens = significant(lex("<?php $obj->class; $obj?->namespace;"));

        ASSERT_GE(tokens.size(), 8u);
        EXPECT_EQ(tokens[2].kind, TokenKind::ObjectOperator);
        EXPECT_EQ(tokens[3].kind, TokenKind::Identifier);
        EXPECT_EQ(tokens[3].text, "class");
        EXPECT_EQ(tokens[6].kind, TokenKind::NullsafeObjectOperator);
        EXPECT_EQ(tokens[7].kind, TokenKind::Identifier);
    }

    TEST(LexerTest, ClassConstantKeepsKeywordAfterDoubleColon) {
        const auto tokens = significant(lex("<?php Foo::class;"));

        ASSERT_GE(tokens.size(), 4u);
        EXPECT_EQ(tokens[2].kind, TokenKind::DoubleColon);
        EXPECT_EQ(tokens[3].kind, TokenKind::Class);
    }

    TEST(LexerTest, EnumKeywordRequiresFollowingName) {
        EXPECT_EQ(significant(lex("<?php enum Suit {}"))[1].kind, TokenKind::Enum);
        EXPECT_EQ(significant(lex("<?php enum /* c */ Suit {}"))[1].kind, TokenKind::Enum);
        EXPECT_EQ(significant(lex("<?php enum\n// c\nSuit {}"))[1].kind, TokenKind::Enum);
    }

    TEST(LexerTest, EnumAsPlainIdentifier) {
        EXPECT_EQ(significant(lex("<?php enum();"))[1].kind, TokenKind::Identifier);
        EXPECT_EQ(significant(lex("<?php class enum extends Base {}"))[2].kind, TokenKind::Identifier);
        EXPECT_EQ(significant(lex("<?php enum extends"))[1].kind, TokenKind::Identifier);
        EXPECT_EQ(significant(lex("<?php enum implements"))[1].kind, TokenKind::Identifier);
        EXPECT_EQ(significant(lex("<?php $x = enum;"))[3].kind, TokenKind::Identifier);
    }

    TEST(LexerTest, NameTokens) {
        const auto tokens = significant(lex("<?php App\\Models\\User \\App\\Kernel namespace\\Local \\ ;"));

        ASSERT_GE(tokens.size(), 5u);
        EXPECT_EQ(tokens[1].kind, TokenKind::NameQualified);
        EXPECT_EQ(tokens[1].text, "App\\Models\\User");
        EXPECT_EQ(tokens[2].kind, TokenKind::NameFullyQualified);
        EXPECT_EQ(tokens[2].text, "\\App\\Kernel");
        EXPECT_EQ(tokens[3].kind, TokenKind::NameRelative);
        EXPECT_EQ(tokens[4].kind, TokenKind::NsSeparator);
    }

    TEST(LexerTest, StringsAreOpaque) {
        const auto tokens = significant(lex(
            "<?php $a = 'class A {}'; $b = \"interface B {$x}\"; $c = `trait C`;"));

        int strings = 0;
        for (const auto& token : tokens) {
            EXPECT_FALSE(token.is_declaration_keyword());
            if (token.kind == TokenKind::String) {
                ++strings;
            }
        }
        EXPECT_EQ(strings, 3);
    }

    TEST(LexerTest, EscapedQuotesStayInsideString) {
        const auto tokens = significant(lex("<?php $a = 'it\\'s class A'; class B {}"));

        ASSERT_GE(tokens.size(), 6u);
        EXPECT_EQ(tokens[3].kind, TokenKind::String);
        EXPECT_EQ(tokens[3].text, "'it\\'s class A'");
        EXPECT_EQ(tokens[5].kind, TokenKind::Class);
    }

    TEST(LexerTest, HeredocAndNowdocAreOpaque) {
        const auto heredoc = significant(lex("<?php $x = <<<EOT\nclass Fake {}\nEOT;\nclass Real {}"));
        ASSERT_GE(heredoc.size(), 6u);
        EXPECT_EQ(heredoc[3].kind, TokenKind::String);
        EXPECT_EQ(heredoc[5].kind, TokenKind::Class);
        EXPECT_EQ(heredoc[6].text, "Real");

        const auto nowdoc = significant(lex("<?php $x = <<<'EOT'\n    class Fake {}\n    EOT;\nclass Real {}"));
        ASSERT_GE(nowdoc.size(), 6u);
        EXPECT_EQ(nowdoc[3].kind, TokenKind::String);
        EXPECT_EQ(nowdoc[6].text, "Real");
    }

    TEST(LexerTest, CommentsAreTrivia) {
        const auto tokens = lex("<?php // class A {}\n# class B {}\n/* class C {} */ /** @var D */");

        for (const auto& token : tokens) {
            EXPECT_FALSE(token.is_declaration_keyword());
        }
        EXPECT_EQ(tokens.back().kind, TokenKind::DocComment);
    }

    TEST(LexerTest, LineCommentEndsAtCloseTag) {
        const auto tokens = lex("<?php // note ?>html");

        const std::vector<TokenKind> expected = {
            TokenKind::OpenTag, TokenKind::Comment, TokenKind::CloseTag, TokenKind::InlineHtml
        };
        EXPECT_EQ(kinds(tokens), expected);
        EXPECT_EQ(tokens[1].text, "// note ");
    }

    TEST(LexerTest, AttributeStartIsNotAComment) {
        const auto tokens = significant(lex("<?php #[Attr] class A {}"));

        ASSERT_GE(tokens.size(), 6u);
        EXPECT_EQ(tokens[1].kind, TokenKind::AttributeStart);
        EXPECT_EQ(tokens[2].text, "Attr");
        EXPECT_EQ(tokens[4].kind, TokenKind::Class);
    }

    TEST(LexerTest, UnterminatedCommentRunsToEnd) {
        const auto tokens = lex("<?php /* class A {}");

        ASSERT_EQ(tokens.size(), 2u);
        EXPECT_EQ(tokens[1].kind, TokenKind::Comment);
    }

    TEST(LexerTest, OperatorsUseLongestMatch) {
        const auto tokens = significant(lex("<?php $a ??= $b <=> $c;"));

        ASSERT_GE(tokens.size(), 6u);
        EXPECT_EQ(tokens[2].kind, TokenKind::Operator);
        EXPECT_EQ(tokens[2].text, "??=");
        EXPECT_EQ(tokens[4].text, "<=>");
    }

    TEST(LexerTest, TracksLineNumbers) {
        const auto tokens = significant(lex("<?php\n\nclass A\n{\n}\n"));

        ASSERT_GE(tokens.size(), 5u);
        EXPECT_EQ(tokens[1].line, 3u);
        EXPECT_EQ(tokens[3].line, 4u);
        EXPECT_EQ(tokens[4].line, 5u);
    }

    TEST(LexerTest, NulByteInCodeIsParseError) {
        const std::string source("<?php class A {}\0", 17);
        Lexer lexer(source);

        const auto tokens = lexer.tokenize();
        ASSERT_TRUE(tokens.is_err());
        EXPECT_EQ(tokens.error().code(), ErrorCode::ParseError);
    }

    TEST(LexerTest, NulByteInHtmlOrStringIsAccepted) {
        const std::string in_html("a\0b<?php class A {}", 19);
        EXPECT_TRUE(Lexer(in_html).tokenize().is_ok());

        const std::string in_string("<?php $s = 'a\0b';", 17);
        EXPECT_TRUE(Lexer(in_string).tokenize().is_ok());
    }

    TEST(LexerTest, TokenizeOrEmptyReportsWarning) {
        const std::string source("<?php \0", 7);
        std::vector<Error> warnings;

        const auto tokens = tokenize_or_empty(source, "/srv/app/Broken.php",
            [&warnings](const Error& e) { warnings.push_back(e); });

        EXPECT_TRUE(tokens.empty());
        ASSERT_EQ(warnings.size(), 1u);
        EXPECT_EQ(warnings[0].code(), ErrorCode::ParseError);
        ASSERT_TRUE(warnings[0].context().has_value());
        EXPECT_NE(warnings[0].context()->find("/srv/app/Broken.php"), std::string::npos);
    }

}  // namespace classmap::scanner
