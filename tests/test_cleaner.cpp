#include <gtest/gtest.h>
#include "../main/src/cleaner.hpp"
#include "../main/src/cache_catalog.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class CleanerTest : public ::testing::Test {
protected:
    fs::path cache_dir;
    Config config;

    void SetUp() override {
        init_localization();
        cache_dir = fs::absolute("tmp_cleaner_test");
        fs::remove_all(cache_dir);
        fs::create_directories(cache_dir);
    }

    void TearDown() override {
        fs::permissions(cache_dir, fs::perms::owner_all, fs::perm_options::add);
        fs::remove_all(cache_dir);
    }

    CacheFileEntry make_file(const std::string& name, const std::string& content = "archive") {
        std::ofstream(cache_dir / name) << content;
        return parse_cache_filename(name, cache_dir, config);
    }
};

TEST_F(CleanerTest, PrintsCanonicalNames) {
    std::vector<CacheFileEntry> pkgs = {
        parse_cache_filename("foo-bar-1.0-3.any.pkg.tar.xz", cache_dir, config),
        parse_cache_filename("curl-7.80.0-1-x86_64.pkg.tar.zst", cache_dir, config),
    };
    std::ostringstream out;
    print_packages(pkgs, out);
    EXPECT_EQ(out.str(), "foo-bar-1.0-3\ncurl-7.80.0-1\n");
}

TEST_F(CleanerTest, PrintsNothingForEmptySelection) {
    std::ostringstream out;
    print_packages({}, out);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CleanerTest, RemovesSelectedFiles) {
    auto a = make_file("curl-7.79.0-1-x86_64.pkg.tar.zst", "12345");
    auto b = make_file("curl-7.80.0-1-x86_64.pkg.tar.zst", "123");
    auto keep = make_file("curl-7.81.0-1-x86_64.pkg.tar.zst");

    auto report = remove_packages({a, b});
    EXPECT_EQ(report.removed, 2u);
    EXPECT_EQ(report.already_absent, 0u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_EQ(report.bytes_freed, 8u);
    EXPECT_FALSE(fs::exists(a.file_path));
    EXPECT_FALSE(fs::exists(b.file_path));
    EXPECT_TRUE(fs::exists(keep.file_path));
}

TEST_F(CleanerTest, VanishedFileIsNotAnError) {
    auto gone = make_file("wget-1.2-1.any.pkg.tar.xz");
    auto present = make_file("wget-1.3-1.any.pkg.tar.xz");
    fs::remove(gone.file_path);

    RemovalReport report;
    EXPECT_NO_THROW(report = remove_packages({gone, present}));
    EXPECT_EQ(report.removed, 1u);
    EXPECT_EQ(report.already_absent, 1u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_FALSE(fs::exists(present.file_path));
}

TEST_F(CleanerTest, PermissionDeniedStopsImmediately) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }
    auto first = make_file("a-1-1-any.pkg.tar.zst");
    auto second = make_file("b-1-1-any.pkg.tar.zst");
    fs::permissions(cache_dir, fs::perms::owner_write, fs::perm_options::remove);

    try {
        remove_packages({first, second});
        FAIL() << "expected DeletionPermissionDenied";
    } catch (const DeletionPermissionDenied& e) {
        EXPECT_EQ(e.path(), first.file_path.string());
    }
    EXPECT_TRUE(fs::exists(first.file_path));
    EXPECT_TRUE(fs::exists(second.file_path));
}
