#pragma once

#include "cache_catalog.hpp"
#include "installed_catalog.hpp"
#include "package.hpp"

#include <cstddef>
#include <vector>

// Cache entries whose name matches no installed package, in cache order.
std::vector<CacheFileEntry> select_uninstalled(const CacheCatalog& cache, const InstalledCatalog& installed);

// For every installed name, the cache entries beyond the `keep` highest in
// package order. With keep == 0 every cache entry of an installed name is
// selected.
std::vector<CacheFileEntry> select_excess_old(const CacheCatalog& cache, const InstalledCatalog& installed, std::size_t keep);

// Cache entries equal to any of the given identities. The CacheFileEntry
// overload matches each entry's own file only.
std::vector<CacheFileEntry> resolve_to_files(const std::vector<PackageIdentity>& identities, const CacheCatalog& cache);
std::vector<CacheFileEntry> resolve_to_files(const std::vector<CacheFileEntry>& packages, const CacheCatalog& cache);

// Stable sort by name, version, release.
std::vector<CacheFileEntry> sort_packages(std::vector<CacheFileEntry> entries);
