//
// Created by gregorian-rayne on 2/14/26.
//

#include "classmap/options.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace classmap;
namespace fs = std::filesystem;

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
            ("classmap_options_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    fs::path create_test_file(const std::string& filename, const std::string& content) const {
        const fs::path file_path = temp_dir / filename;
        std::ofstream file(file_path);
        file << content;
        file.close();
        return file_path;
    }

    fs::path temp_dir;
};

TEST_F(OptionsTest, Defaults) {
    const Options options;

    EXPECT_EQ(options.extensions, std::vector<std::string>{"php"});
    EXPECT_TRUE(options.exclude.empty());
    EXPECT_FALSE(options.case_sensitive);
    EXPECT_FALSE(options.follow_symlinks);
    EXPECT_FALSE(options.prepend);
    EXPECT_FALSE(options.include_static);
    EXPECT_TRUE(options.relative);
    EXPECT_EQ(options.namespace_name, "");
    EXPECT_EQ(options.class_name, "Autoloader");
    EXPECT_TRUE(options.validate().is_ok());
}

TEST_F(OptionsTest, LoadFromString) {
    const auto options = Options::load_from_string(R"(
[scan]
extensions = ["php", "inc"]
exclude = ["vendor/*", "tests/*"]
follow_symlinks = true
include_static = true

[loader]
case_sensitive = true
prepend = true

[generate]
relative = false
namespace = "App\\Loader"
class_name = "ClassLoader"
)");

    ASSERT_TRUE(options.is_ok()) << options.error().to_string();
    const auto& o = options.value();
    EXPECT_EQ(o.extensions, (std::vector<std::string>{"php", "inc"}));
    EXPECT_EQ(o.exclude, (std::vector<std::string>{"vendor/*", "tests/*"}));
    EXPECT_TRUE(o.follow_symlinks);
    EXPECT_TRUE(o.include_static);
    EXPECT_TRUE(o.case_sensitive);
    EXPECT_TRUE(o.prepend);
    EXPECT_FALSE(o.relative);
    EXPECT_EQ(o.namespace_name, "App\\Loader");
    EXPECT_EQ(o.class_name, "ClassLoader");
}

TEST_F(OptionsTest, MissingKeysKeepDefaults) {
    const auto options = Options::load_from_string("[loader]\nprepend = true\n");

    ASSERT_TRUE(options.is_ok());
    EXPECT_TRUE(options.value().prepend);
    EXPECT_EQ(options.value().extensions, std::vector<std::string>{"php"});
    EXPECT_TRUE(options.value().relative);
}

TEST_F(OptionsTest, InvalidTomlIsConfigError) {
    const auto options = Options::load_from_string("[scan\nextensions = ");

    ASSERT_TRUE(options.is_err());
    EXPECT_EQ(options.error().code(), ErrorCode::ConfigError);
}

TEST_F(OptionsTest, InvalidValuesAreConfigError) {
    const auto options = Options::load_from_string("[scan]\nextensions = []\n[generate]\nclass_name = \"1Loader\"\n");

    ASSERT_TRUE(options.is_err());
    EXPECT_EQ(options.error().code(), ErrorCode::ConfigError);
    EXPECT_NE(options.error().message().find("extensions"), std::string::npos);
    EXPECT_NE(options.error().message().find("class_name"), std::string::npos);
}

TEST_F(OptionsTest, ValidateRejectsBadNames) {
    Options options;
    options.namespace_name = "App\\1Bad";
    EXPECT_TRUE(options.validate().is_err());

    options.namespace_name = "\\App\\Loader\\";
    EXPECT_TRUE(options.validate().is_ok());

    options.exclude = {""};
    EXPECT_TRUE(options.validate().is_err());
}

TEST_F(OptionsTest, LoadFromFile) {
    const auto path = create_test_file("classmap.toml", "[scan]\nexclude = [\"vendor/*\"]\n");

    const auto options = Options::load_from_file(path);
    ASSERT_TRUE(options.is_ok());
    EXPECT_EQ(options.value().exclude, std::vector<std::string>{"vendor/*"});
}

TEST_F(OptionsTest, LoadFromMissingFileIsConfigError) {
    const auto options = Options::load_from_file(temp_dir / "missing.toml");

    ASSERT_TRUE(options.is_err());
    EXPECT_EQ(options.error().code(), ErrorCode::ConfigError);
}

TEST_F(OptionsTest, ToStringLoadsBack) {
    Options options;
    options.extensions = {"php", "inc"};
    options.exclude = {"vendor/*"};
    options.prepend = true;
    options.namespace_name = "App\\Loader";

    const auto loaded = Options::load_from_string(options.to_string());
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();
    EXPECT_EQ(loaded.value().fingerprint(), options.fingerprint());
}

TEST_F(OptionsTest, FingerprintChangesWithEveryScanField) {
    const Options base;
    Options other;

    other.include_static = true;
    EXPECT_NE(base.fingerprint(), other.fingerprint());

    other = Options{};
    other.exclude = {"vendor/*"};
    EXPECT_NE(base.fingerprint(), other.fingerprint());

    other = Options{};
    other.extensions = {"php", "inc"};
    EXPECT_NE(base.fingerprint(), other.fingerprint());

    EXPECT_EQ(base.fingerprint(), Options{}.fingerprint());
}

TEST_F(OptionsTest, MatchesExtension) {
    Options options;
    options.extensions = {".PHP", "inc"};

    EXPECT_TRUE(options.matches_extension("src/Kernel.php"));
    EXPECT_TRUE(options.matches_extension("src/legacy.INC"));
    EXPECT_FALSE(options.matches_extension("src/readme.md"));
    EXPECT_FALSE(options.matches_extension("src/Makefile"));
}

TEST_F(OptionsTest, IsExcluded) {
    Options options;
    options.exclude = {"vendor/*", "*.generated.php"};

    EXPECT_TRUE(options.is_excluded("vendor/acme/Thing.php"));
    EXPECT_TRUE(options.is_excluded("src/Model.generated.php"));
    EXPECT_FALSE(options.is_excluded("src/Kernel.php"));
}

TEST(PhpLabelTest, Validation) {
    EXPECT_TRUE(is_php_label("Autoloader"));
    EXPECT_TRUE(is_php_label("_private2"));
    EXPECT_FALSE(is_php_label(""));
    EXPECT_FALSE(is_php_label("2fast"));
    EXPECT_FALSE(is_php_label("with-dash"));
}
