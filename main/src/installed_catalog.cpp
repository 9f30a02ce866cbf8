#include "installed_catalog.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    const std::string& field_after(const std::vector<std::string>& lines, const std::string& marker, const std::string& source) {
        auto it = std::ranges::find(lines, marker);
        if (it == lines.end()) {
            throw MalformedInstalledRecord(string_format("error.record_missing_marker", source, marker), source);
        }
        if (++it == lines.end()) {
            throw MalformedInstalledRecord(string_format("error.record_missing_value", source, marker), source);
        }
        return *it;
    }
}

InstalledRecord parse_installed_record(const std::vector<std::string>& lines, const std::string& source) {
    InstalledRecord record;
    record.source = source;
    record.identity.name = field_after(lines, NAME_MARKER, source);
    record.identity.arch = field_after(lines, ARCH_MARKER, source);

    const std::string& full_version = field_after(lines, VERSION_MARKER, source);
    const auto hyphen = full_version.find('-');
    if (hyphen == std::string::npos || hyphen == 0 || hyphen + 1 == full_version.size() ||
        full_version.find('-', hyphen + 1) != std::string::npos) {
        throw MalformedInstalledRecord(string_format("error.record_bad_version", source, full_version), source);
    }
    record.identity.version = full_version.substr(0, hyphen);
    record.identity.release = full_version.substr(hyphen + 1);
    return record;
}

InstalledCatalog build_installed_catalog(const fs::path& dir, const Config& config) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw InstalledDbUnreadable(string_format("error.installed_db_unreadable", dir.string(), ec.message()), dir.string());
    }

    std::vector<InstalledRecord> records;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) continue;

        const std::string source = it->path().filename().string();
        const fs::path desc = it->path() / config.desc_file_name;
        auto lines = read_lines(desc);
        if (!lines) {
            throw MalformedInstalledRecord(string_format("error.record_missing_desc", source, desc.string()), source);
        }
        records.push_back(parse_installed_record(*lines, source));
    }
    if (ec) {
        throw InstalledDbUnreadable(string_format("error.installed_db_unreadable", dir.string(), ec.message()), dir.string());
    }
    return InstalledCatalog(std::move(records));
}
