//
// Created by gregorian-rayne on 2/14/26.
//

#include "classmap/mapping_builder.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace classmap;
namespace fs = std::filesystem;

class MappingBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
            ("classmap_builder_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
        builder = std::make_unique<MappingBuilder>([this](const Error& e) { warnings.push_back(e); });
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void create_file(const std::string& relative, const std::string& content) const {
        const fs::path path = temp_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    [[nodiscard]] fs::path canonical(const std::string& relative) const {
        return fs::canonical(temp_dir / relative);
    }

    fs::path temp_dir;
    std::unique_ptr<MappingBuilder> builder;
    std::vector<Error> warnings;
};

TEST_F(MappingBuilderTest, MapsDeclarationsToCanonicalFiles) {
    create_file("Kernel.php", "<?php namespace App; class Kernel {}");
    create_file("Http/Request.php", "<?php namespace App\\Http; class Request {} interface RequestInterface {}");
    create_file("README.md", "class NotPhp {}");

    const auto map = builder->build(temp_dir, Options{});

    ASSERT_TRUE(map.is_ok()) << map.error().to_string();
    const auto& result = map.value();
    EXPECT_EQ(result.root, fs::canonical(temp_dir));
    ASSERT_EQ(result.symbols.size(), 3u);
    EXPECT_EQ(*result.symbols.find("App\\Kernel"), canonical("Kernel.php"));
    EXPECT_EQ(*result.symbols.find("App\\Http\\Request"), canonical("Http/Request.php"));
    EXPECT_EQ(*result.symbols.find("App\\Http\\RequestInterface"), canonical("Http/Request.php"));
    EXPECT_TRUE(result.static_files.empty());
    EXPECT_EQ(result.stats.files_visited, 2u);
    EXPECT_EQ(result.stats.files_scanned, 2u);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(MappingBuilderTest, DuplicateIdentifierLastFileWins) {
    create_file("a.php", "<?php class Dup {}");
    create_file("b.php", "<?php class Dup {}");

    const auto map = builder->build(temp_dir, Options{});

    ASSERT_TRUE(map.is_ok());
    ASSERT_EQ(map.value().symbols.size(), 1u);
    EXPECT_EQ(*map.value().symbols.find("Dup"), canonical("b.php"));
    EXPECT_EQ(map.value().stats.duplicate_symbols, 1u);
}

TEST_F(MappingBuilderTest, StaticFilesOnlyWithIncludeStatic) {
    create_file("Kernel.php", "<?php class Kernel {}");
    create_file("helpers.php", "<?php function helper() {}");
    create_file("bootstrap.php", "<?php declare(strict_types=1); namespace App;");

    const auto without = builder->build(temp_dir, Options{});
    ASSERT_TRUE(without.is_ok());
    EXPECT_TRUE(without.value().static_files.empty());

    Options options;
    options.include_static = true;
    const auto with = builder->build(temp_dir, options);
    ASSERT_TRUE(with.is_ok());
    ASSERT_EQ(with.value().static_files.size(), 1u);
    EXPECT_EQ(with.value().static_files[0], canonical("helpers.php"));
    EXPECT_EQ(with.value().stats.static_files, 1u);
}

TEST_F(MappingBuilderTest, ExcludedFilesAreNotScanned) {
    create_file("src/Kernel.php", "<?php class Kernel {}");
    create_file("vendor/Lib.php", "<?php class Lib {}");

    Options options;
    options.exclude = {"vendor/*"};
    const auto map = builder->build(temp_dir, options);

    ASSERT_TRUE(map.is_ok());
    EXPECT_TRUE(map.value().symbols.contains("Kernel"));
    EXPECT_FALSE(map.value().symbols.contains("Lib"));
}

TEST_F(MappingBuilderTest, EmptyDirectoryIsSuccessAndCached) {
    const auto map = builder->build(temp_dir, Options{});

    ASSERT_TRUE(map.is_ok());
    EXPECT_TRUE(map.value().empty());
    EXPECT_TRUE(builder->is_cached(temp_dir, Options{}));
}

TEST_F(MappingBuilderTest, SecondBuildComesFromCache) {
    create_file("A.php", "<?php class A {}");
    ASSERT_TRUE(builder->build(temp_dir, Options{}).is_ok());
    EXPECT_EQ(builder->cache_size(), 1u);

    // Files added after the first scan are invisible until the cache is cleared.
    create_file("B.php", "<?php class B {}");
    const auto cached = builder->build(temp_dir, Options{});
    ASSERT_TRUE(cached.is_ok());
    EXPECT_FALSE(cached.value().symbols.contains("B"));

    builder->clear_cache();
    EXPECT_EQ(builder->cache_size(), 0u);
    const auto fresh = builder->build(temp_dir, Options{});
    ASSERT_TRUE(fresh.is_ok());
    EXPECT_TRUE(fresh.value().symbols.contains("B"));
}

TEST_F(MappingBuilderTest, CacheKeyDependsOnOptionsAndCanonicalPath) {
    create_file("A.php", "<?php class A {}");
    create_file("sub/B.php", "<?php class B {}");

    ASSERT_TRUE(builder->build(temp_dir, Options{}).is_ok());
    EXPECT_TRUE(builder->is_cached(temp_dir / "sub" / "..", Options{}));

    Options other;
    other.include_static = true;
    EXPECT_FALSE(builder->is_cached(temp_dir, other));

    const auto a = MappingBuilder::cache_key(fs::canonical(temp_dir), Options{});
    const auto b = MappingBuilder::cache_key(fs::canonical(temp_dir), other);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value(), b.value());
    EXPECT_EQ(a.value().size(), 32u);
}

TEST_F(MappingBuilderTest, BadRootIsReported) {
    const auto missing = builder->build(temp_dir / "missing", Options{});

    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(warnings.size(), 1u);

    create_file("file.php", "<?php class A {}");
    const auto not_dir = builder->build(temp_dir / "file.php", Options{});
    ASSERT_TRUE(not_dir.is_err());
    EXPECT_EQ(not_dir.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(MappingBuilderTest, InvalidOptionsAreRejected) {
    Options options;
    options.extensions.clear();

    const auto map = builder->build(temp_dir, options);
    ASSERT_TRUE(map.is_err());
    EXPECT_EQ(map.error().code(), ErrorCode::ConfigError);
}

TEST_F(MappingBuilderTest, UntokenizableFileIsSkipped) {
    create_file("Good.php", "<?php class Good {}");
    create_file("Broken.php", std::string("<?php class Broken {}\0", 22));

    const auto map = builder->build(temp_dir, Options{});

    ASSERT_TRUE(map.is_ok());
    EXPECT_TRUE(map.value().symbols.contains("Good"));
    EXPECT_FALSE(map.value().symbols.contains("Broken"));
    EXPECT_EQ(map.value().stats.files_failed, 1u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].code(), ErrorCode::ParseError);
}

TEST_F(MappingBuilderTest, SymlinkedFileOutsideExclusionIsRechecked) {
    create_file("vendor/Lib.php", "<?php class Lib {}");
    std::error_code ec;
    fs::create_symlink(temp_dir / "vendor" / "Lib.php", temp_dir / "Alias.php", ec);
    if (ec) {
        GTEST_SKIP() << "Symbolic links not supported: " << ec.message();
    }

    Options options;
    options.exclude = {"vendor/*"};
    const auto map = builder->build(temp_dir, options);

    ASSERT_TRUE(map.is_ok());
    EXPECT_FALSE(map.value().symbols.contains("Lib"));
}
