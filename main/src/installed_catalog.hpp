#pragma once

#include "catalog.hpp"
#include "config.hpp"
#include "package.hpp"

#include <filesystem>
#include <string>
#include <vector>

using InstalledCatalog = Catalog<InstalledRecord>;

inline constexpr const char* NAME_MARKER = "%NAME%";
inline constexpr const char* VERSION_MARKER = "%VERSION%";
inline constexpr const char* ARCH_MARKER = "%ARCH%";

// Parses the lines of a local db "desc" file. source names the record in
// errors. Throws MalformedInstalledRecord.
InstalledRecord parse_installed_record(const std::vector<std::string>& lines, const std::string& source);

// Throws InstalledDbUnreadable or MalformedInstalledRecord.
InstalledCatalog build_installed_catalog(const std::filesystem::path& dir, const Config& config);
