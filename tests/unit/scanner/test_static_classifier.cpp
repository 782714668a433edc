//
// Created by gregorian-rayne on 2/14/26.
//

#include "classmap/scanner/static_classifier.hpp"
#include "classmap/scanner/lexer.hpp"

#include <gtest/gtest.h>

namespace classmap::scanner
{
    namespace {

        FileKind classify(const std::string_view source) {
            Lexer lexer(source);
            auto tokens = lexer.tokenize();
            EXPECT_TRUE(tokens.is_ok());
            if (tokens.is_err()) {
                return FileKind::Empty;
            }

            SymbolExtractor extractor;
            const auto symbols = extractor.extract(tokens.value());
            const StaticFileClassifier classifier;
            return classifier.classify(tokens.value(), symbols);
        }

    }  // namespace

    TEST(StaticFileClassifierTest, DeclarationsWin) {
        EXPECT_EQ(classify("<?php class A {} function helper() {}"), FileKind::Declarations);
    }

    TEST(StaticFileClassifierTest, FunctionsAndConstantsAreStatic) {
        EXPECT_EQ(classify("<?php function helper() { return 1; }"), FileKind::Static);
        EXPECT_EQ(classify("<?php namespace App; const LIMIT = 10;"), FileKind::Static);
        EXPECT_EQ(classify("<?php define('LIMIT', 10);"), FileKind::Static);
    }

    TEST(StaticFileClassifierTest, TopLevelCodeIsStatic) {
        EXPECT_EQ(classify("<?php echo 'hello';"), FileKind::Static);
        EXPECT_EQ(classify("<?= $title ?>"), FileKind::Static);
        EXPECT_EQ(classify("<?php return new class {};"), FileKind::Static);
    }

    TEST(StaticFileClassifierTest, StructuralStatementsAreEmpty) {
        EXPECT_EQ(classify("<?php\ndeclare(strict_types=1);\nnamespace App;\nuse Foo\\Bar;\nuse Foo\\{A, B};\n"),
                  FileKind::Empty);
        EXPECT_EQ(classify("<?php namespace App { }"), FileKind::Empty);
        EXPECT_EQ(classify("<?php ;;"), FileKind::Empty);
    }

    TEST(StaticFileClassifierTest, TriviaAndHtmlAreEmpty) {
        EXPECT_EQ(classify(""), FileKind::Empty);
        EXPECT_EQ(classify("<html><body></body></html>"), FileKind::Empty);
        EXPECT_EQ(classify("<?php\n// nothing here\n/** @file */\n?>\n<p>footer</p>"), FileKind::Empty);
    }

    TEST(StaticFileClassifierTest, DeclareBlockWithCodeIsStatic) {
        EXPECT_EQ(classify("<?php declare(ticks=1) { tick(); }"), FileKind::Static);
    }

    TEST(StaticFileClassifierTest, IsStaticMatchesClassify) {
        Lexer lexer("<?php function helper() {}");
        const auto tokens = lexer.tokenize();
        ASSERT_TRUE(tokens.is_ok());

        SymbolExtractor extractor;
        const auto symbols = extractor.extract(tokens.value());
        EXPECT_TRUE(StaticFileClassifier().is_static(tokens.value(), symbols));
        EXPECT_TRUE(StaticFileClassifier::has_executable_content(tokens.value()));
    }

    TEST(StaticFileClassifierTest, KindNames) {
        EXPECT_STREQ(file_kind_name(FileKind::Empty), "Empty");
        EXPECT_STREQ(file_kind_name(FileKind::Declarations), "Declarations");
        EXPECT_STREQ(file_kind_name(FileKind::Static), "Static");
    }

}  // namespace classmap::scanner
