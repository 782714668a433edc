//
// Created by gregorian-rayne on 2/14/26.
//

#include "classmap/utils/path_utils.hpp"

#include <gtest/gtest.h>

using namespace classmap;
using namespace classmap::path_utils;

TEST(PathUtilsTest, SegmentsIgnoresEmptyParts) {
    const auto parts = segments("/srv//app/src/");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "srv");
    EXPECT_EQ(parts[1], "app");
    EXPECT_EQ(parts[2], "src");
}

TEST(PathUtilsTest, RelativeSegmentsBelowBase) {
    EXPECT_EQ(relative_segments("/srv/app", "/srv/app/Kernel.php"), "/Kernel.php");
    EXPECT_EQ(relative_segments("/srv/app", "/srv/app/Http/Request.php"), "/Http/Request.php");
}

TEST(PathUtilsTest, RelativeSegmentsClimbsOutOfBase) {
    EXPECT_EQ(relative_segments("/srv/app/public", "/srv/app/src/Kernel.php"), "/../src/Kernel.php");
    EXPECT_EQ(relative_segments("/a/b/c", "/x/y.php"), "/../../../x/y.php");
}

TEST(PathUtilsTest, RelativeToRootUsesForwardSlashes) {
    EXPECT_EQ(relative_to_root("/srv/app/src/Http/Request.php", "/srv/app/src"), "Http/Request.php");
}

TEST(PathUtilsTest, RelativeToRootOutsideRootReturnsFile) {
    EXPECT_EQ(relative_to_root("/opt/lib/Thing.php", "/srv/app"), "/opt/lib/Thing.php");
}

TEST(PathUtilsTest, LowercaseExtension) {
    EXPECT_EQ(lowercase_extension("Kernel.PHP"), "php");
    EXPECT_EQ(lowercase_extension("archive.tar.gz"), "gz");
    EXPECT_EQ(lowercase_extension("Makefile"), "");
}

TEST(PathUtilsTest, CanonicalReportsMissingPath) {
    const auto result = canonical("/definitely/not/here/classmap");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}
