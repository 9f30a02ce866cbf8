#include <gtest/gtest.h>
#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        init_localization();
        work_dir = fs::absolute("tmp_config_test");
        fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        fs::remove_all(work_dir);
    }

    fs::path write_conf(const std::string& content) {
        const fs::path path = work_dir / "pacsweep.conf";
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.cache_dir, "/var/cache/pacman/pkg/");
    EXPECT_EQ(config.installed_dir, "/var/lib/pacman/local/");
    EXPECT_EQ(config.keep, 2u);
    EXPECT_EQ(config.desc_file_name, "desc");
    EXPECT_FALSE(config.skip_malformed);
    EXPECT_TRUE(is_known_architecture(config, "any"));
    EXPECT_TRUE(is_known_architecture(config, "x86_64"));
    EXPECT_TRUE(is_known_architecture(config, "i686"));
    EXPECT_FALSE(is_known_architecture(config, "aarch64"));
}

TEST_F(ConfigTest, CustomRoot) {
    Config config;
    const std::string root = "/mnt/new_root";
    rebase_config(config, root);

    EXPECT_EQ(config.cache_dir, fs::path(root) / "var/cache/pacman/pkg/");
    EXPECT_EQ(config.installed_dir, fs::path(root) / "var/lib/pacman/local/");
    EXPECT_EQ(config.config_file, fs::path(root) / fs::path(PACSWEEP_CONF_FILE).relative_path());
}

TEST_F(ConfigTest, CustomRootWithTrailingSlash) {
    Config config;
    rebase_config(config, "/mnt/new_root/");
    EXPECT_EQ(config.cache_dir, fs::path("/mnt/new_root/var/cache/pacman/pkg/"));
}

TEST_F(ConfigTest, EmptyRootMeansSlash) {
    Config config;
    rebase_config(config, "");
    EXPECT_EQ(config.installed_dir, fs::path("/var/lib/pacman/local/"));
}

TEST_F(ConfigTest, LoadsKeyValueFile) {
    auto path = write_conf(
        "# comment\n"
        "\n"
        "cache_dir = /srv/cache\n"
        "installed_dir=/srv/local\n"
        "keep = 3\n"
        "extensions = pkg.tar.xz   pkg.tar.gzip\n"
        "architectures = any aarch64\n"
        "skip_malformed = yes\n"
        "desc_file = meta\n");

    Config config;
    load_config_file(path, config, true);
    EXPECT_EQ(config.cache_dir, "/srv/cache");
    EXPECT_EQ(config.installed_dir, "/srv/local");
    EXPECT_EQ(config.keep, 3u);
    EXPECT_EQ(config.extensions, (std::vector<std::string>{"pkg.tar.xz", "pkg.tar.gzip"}));
    EXPECT_TRUE(is_known_architecture(config, "aarch64"));
    EXPECT_FALSE(is_known_architecture(config, "x86_64"));
    EXPECT_TRUE(config.skip_malformed);
    EXPECT_EQ(config.desc_file_name, "meta");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    auto path = write_conf("colour = always\nkeep = 4\n");
    Config config;
    EXPECT_NO_THROW(load_config_file(path, config, true));
    EXPECT_EQ(config.keep, 4u);
}

TEST_F(ConfigTest, InvalidValues) {
    Config config;
    EXPECT_THROW(load_config_file(write_conf("keep = -1\n"), config, true), PacsweepException);
    EXPECT_THROW(load_config_file(write_conf("keep = two\n"), config, true), PacsweepException);
    EXPECT_THROW(load_config_file(write_conf("skip_malformed = maybe\n"), config, true), PacsweepException);
    EXPECT_THROW(load_config_file(write_conf("extensions =\n"), config, true), PacsweepException);
    EXPECT_THROW(load_config_file(write_conf("just some words\n"), config, true), PacsweepException);
    EXPECT_EQ(config.keep, DEFAULT_KEEP);
}

TEST_F(ConfigTest, MissingFile) {
    Config config;
    EXPECT_NO_THROW(load_config_file(work_dir / "absent.conf", config, false));
    EXPECT_THROW(load_config_file(work_dir / "absent.conf", config, true), PacsweepException);
}
