#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>

namespace fs = std::filesystem;

namespace {
    bool parse_bool(const std::string& key, std::string_view value) {
        if (value == "true" || value == "yes" || value == "1") return true;
        if (value == "false" || value == "no" || value == "0") return false;
        throw PacsweepException(string_format("error.config_invalid_value", key, value));
    }

    std::size_t parse_keep(std::string_view value) {
        std::size_t keep = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), keep);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            throw PacsweepException(string_format("error.config_invalid_value", "keep", value));
        }
        return keep;
    }

    std::vector<std::string> parse_list(const std::string& key, std::string_view value) {
        auto items = split_whitespace(value);
        if (items.empty()) {
            throw PacsweepException(string_format("error.config_invalid_value", key, value));
        }
        return items;
    }
}

void rebase_config(Config& config, const std::string& root_path) {
    fs::path root = fs::path(root_path).lexically_normal();
    if (root.empty()) root = "/";

    auto rebase = [&](const fs::path& p) {
        if (p.is_absolute()) {
            return root / p.relative_path();
        }
        return root / p;
    };

    config.cache_dir = rebase(config.cache_dir);
    config.installed_dir = rebase(config.installed_dir);
    config.config_file = rebase(config.config_file);
}

void load_config_file(const fs::path& path, Config& config, bool required) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (required) {
            throw PacsweepException(string_format("error.open_file_failed", path.string()));
        }
        return;
    }

    std::string raw;
    int line_no = 0;
    while (std::getline(file, raw)) {
        ++line_no;
        std::string_view line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            throw PacsweepException(string_format("error.config_syntax", path.string(), line_no));
        }
        const std::string key(trim(line.substr(0, eq)));
        const std::string_view value = trim(line.substr(eq + 1));

        if (key == "cache_dir") {
            config.cache_dir = std::string(value);
        } else if (key == "installed_dir") {
            config.installed_dir = std::string(value);
        } else if (key == "keep") {
            config.keep = parse_keep(value);
        } else if (key == "extensions") {
            config.extensions = parse_list(key, value);
        } else if (key == "architectures") {
            config.architectures = parse_list(key, value);
        } else if (key == "skip_malformed") {
            config.skip_malformed = parse_bool(key, value);
        } else if (key == "desc_file") {
            if (value.empty()) {
                throw PacsweepException(string_format("error.config_invalid_value", key, value));
            }
            config.desc_file_name = std::string(value);
        } else {
            log_warning(string_format("warning.config_unknown_key", key, path.string(), line_no));
        }
    }
}

bool is_known_architecture(const Config& config, const std::string& arch) {
    return std::ranges::find(config.architectures, arch) != config.architectures.end();
}
