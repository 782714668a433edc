//
// Created by gregorian-rayne on 2/14/26.
//

#include "classmap/utils/string_utils.hpp"

#include <gtest/gtest.h>

namespace classmap::string_utils
{
    TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
        EXPECT_EQ(trim("  php \t\n"), "php");
        EXPECT_EQ(trim(""), "");
        EXPECT_EQ(trim("   "), "");
    }

    TEST(StringUtilsTest, TrimCharStripsSeparators) {
        EXPECT_EQ(trim_char("\\App\\Models\\", '\\'), "App\\Models");
        EXPECT_EQ(trim_char("\\\\", '\\'), "");
    }

    TEST(StringUtilsTest, SplitKeepsEmptyParts) {
        const auto parts = split("php,,inc", ',');
        ASSERT_EQ(parts.size(), 3u);
        EXPECT_EQ(parts[0], "php");
        EXPECT_EQ(parts[1], "");
        EXPECT_EQ(parts[2], "inc");
    }

    TEST(StringUtilsTest, IequalsIsAsciiCaseInsensitive) {
        EXPECT_TRUE(iequals("App\\Kernel", "app\\KERNEL"));
        EXPECT_FALSE(iequals("App\\Kernel", "App\\Kernels"));
    }

    TEST(StringUtilsTest, EscapeSingleQuoted) {
        EXPECT_EQ(escape_single_quoted("App\\Kernel"), "App\\\\Kernel");
        EXPECT_EQ(escape_single_quoted("it's"), "it\\'s");
    }

    TEST(GlobMatchTest, StarCrossesDirectorySeparators) {
        EXPECT_TRUE(glob_match("vendor/*", "vendor/acme/lib/Thing.php"));
        EXPECT_TRUE(glob_match("*Test.php", "tests/unit/KernelTest.php"));
        EXPECT_FALSE(glob_match("vendor/*", "src/vendor.php"));
    }

    TEST(GlobMatchTest, QuestionMarkMatchesOneCharacter) {
        EXPECT_TRUE(glob_match("v?.php", "v1.php"));
        EXPECT_FALSE(glob_match("v?.php", "v10.php"));
    }

    TEST(GlobMatchTest, BracketExpressions) {
        EXPECT_TRUE(glob_match("[a-c]*.php", "beta.php"));
        EXPECT_FALSE(glob_match("[a-c]*.php", "delta.php"));
        EXPECT_TRUE(glob_match("[!a-c]*.php", "delta.php"));
        EXPECT_FALSE(glob_match("[!a-c]*.php", "alpha.php"));
    }

    TEST(GlobMatchTest, EscapedAndUnterminated) {
        EXPECT_TRUE(glob_match("\\*.php", "*.php"));
        EXPECT_FALSE(glob_match("\\*.php", "a.php"));
        EXPECT_TRUE(glob_match("[abc", "[abc"));
    }

    TEST(GlobMatchTest, EmptyPatternMatchesOnlyEmptyText) {
        EXPECT_TRUE(glob_match("", ""));
        EXPECT_FALSE(glob_match("", "a.php"));
        EXPECT_TRUE(glob_match("*", ""));
    }

}  // namespace classmap::string_utils
