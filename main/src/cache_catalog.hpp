#pragma once

#include "catalog.hpp"
#include "config.hpp"
#include "package.hpp"

#include <filesystem>
#include <optional>
#include <string>

using CacheCatalog = Catalog<CacheFileEntry>;

// Returns the configured extension (without leading dot) that file_name ends
// with, or std::nullopt if it is not a package archive.
std::optional<std::string> match_extension(const std::string& file_name, const Config& config);

// Parses "<name>-<version>-<release>.<arch>.<ext>" or the pacman form
// "<name>-<version>-<release>-<arch>.<ext>". Throws MalformedCacheFilename.
CacheFileEntry parse_cache_filename(const std::string& file_name, const std::filesystem::path& dir, const Config& config);

// Throws CacheUnreadable or MalformedCacheFilename.
CacheCatalog build_cache_catalog(const std::filesystem::path& dir, const Config& config);
