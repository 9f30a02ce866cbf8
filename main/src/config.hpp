#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Compiled-in defaults; the build may override the system locations.
#ifndef PACSWEEP_CONF_FILE
#define PACSWEEP_CONF_FILE "/etc/pacsweep.conf"
#endif
#ifndef PACSWEEP_L10N_DIR
#define PACSWEEP_L10N_DIR "/usr/share/pacsweep/l10n/"
#endif

inline constexpr const char* DEFAULT_CACHE_DIR = "/var/cache/pacman/pkg/";
inline constexpr const char* DEFAULT_INSTALLED_DIR = "/var/lib/pacman/local/";
inline constexpr std::size_t DEFAULT_KEEP = 2;

struct Config {
    std::filesystem::path cache_dir = DEFAULT_CACHE_DIR;
    std::filesystem::path installed_dir = DEFAULT_INSTALLED_DIR;
    std::filesystem::path config_file = PACSWEEP_CONF_FILE;

    // Archive suffixes without the leading dot, e.g. "pkg.tar.xz".
    std::vector<std::string> extensions = {"pkg.tar.xz", "pkg.tar.zst", "pkg.tar.gz"};
    std::vector<std::string> architectures = {"any", "x86_64", "i686"};

    std::size_t keep = DEFAULT_KEEP;
    std::string desc_file_name = "desc";

    // Malformed cache file names abort the run unless this is set.
    bool skip_malformed = false;
};

// Re-anchors cache_dir, installed_dir and config_file under root_path.
void rebase_config(Config& config, const std::string& root_path);

// Applies "key = value" lines from path onto config. A missing file is only
// an error when required is set.
void load_config_file(const std::filesystem::path& path, Config& config, bool required);

bool is_known_architecture(const Config& config, const std::string& arch);
