#include "cache_catalog.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {
    [[noreturn]] void malformed(const std::string& file_name) {
        throw MalformedCacheFilename(string_format("error.malformed_cache_filename", file_name), file_name);
    }
}

// Longest matching suffix wins, so overlapping entries such as "tar.xz" and
// "pkg.tar.xz" cannot shift the architecture into the extension.
std::optional<std::string> match_extension(const std::string& file_name, const Config& config) {
    std::optional<std::string> best;
    for (const auto& ext : config.extensions) {
        const std::string suffix = "." + ext;
        if (file_name.size() > suffix.size() && file_name.ends_with(suffix)) {
            if (!best || ext.size() > best->size()) best = ext;
        }
    }
    return best;
}

CacheFileEntry parse_cache_filename(const std::string& file_name, const fs::path& dir, const Config& config) {
    auto ext = match_extension(file_name, config);
    if (!ext) malformed(file_name);

    std::string_view stem(file_name);
    stem.remove_suffix(ext->size() + 1);

    CacheFileEntry entry;
    entry.file_name = file_name;
    entry.file_path = dir / file_name;

    auto last_hyphen = stem.rfind('-');
    if (last_hyphen == std::string_view::npos) malformed(file_name);

    if (stem.find('.', last_hyphen) == std::string_view::npos) {
        // name-version-release-arch
        entry.identity.arch = std::string(stem.substr(last_hyphen + 1));
        stem = stem.substr(0, last_hyphen);
    } else {
        // name-version-release.arch
        auto dot = stem.rfind('.');
        entry.identity.arch = std::string(stem.substr(dot + 1));
        stem = stem.substr(0, dot);
    }

    auto rel_sep = stem.rfind('-');
    if (rel_sep == std::string_view::npos || rel_sep == 0) malformed(file_name);
    auto ver_sep = stem.rfind('-', rel_sep - 1);
    if (ver_sep == std::string_view::npos) malformed(file_name);

    entry.identity.name = std::string(stem.substr(0, ver_sep));
    entry.identity.version = std::string(stem.substr(ver_sep + 1, rel_sep - ver_sep - 1));
    entry.identity.release = std::string(stem.substr(rel_sep + 1));

    const auto& id = entry.identity;
    if (id.name.empty() || id.version.empty() || id.release.empty() || id.arch.empty()) {
        malformed(file_name);
    }
    return entry;
}

CacheCatalog build_cache_catalog(const fs::path& dir, const Config& config) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw CacheUnreadable(string_format("error.cache_unreadable", dir.string(), ec.message()), dir.string());
    }

    std::vector<CacheFileEntry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) continue;
        const std::string file_name = it->path().filename().string();
        if (!match_extension(file_name, config)) continue;

        try {
            entries.push_back(parse_cache_filename(file_name, dir, config));
        } catch (const MalformedCacheFilename&) {
            if (!config.skip_malformed) throw;
            log_warning(string_format("warning.skip_malformed_cache_file", file_name));
            continue;
        }

        const auto& arch = entries.back().identity.arch;
        if (!is_known_architecture(config, arch)) {
            log_warning(string_format("warning.unknown_architecture", file_name, arch));
        }
    }
    if (ec) {
        throw CacheUnreadable(string_format("error.cache_unreadable", dir.string(), ec.message()), dir.string());
    }
    return CacheCatalog(std::move(entries));
}
