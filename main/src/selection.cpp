#include "selection.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace {
    // Each cache file is reported once even if several packages match it.
    template <typename P, typename Match>
    std::vector<CacheFileEntry> resolve(const std::vector<P>& packages, const CacheCatalog& cache, Match matches) {
        std::vector<CacheFileEntry> result;
        std::set<std::filesystem::path> seen;
        for (const auto& pkg : packages) {
            for (const auto& file : cache) {
                if (matches(file, pkg) && seen.insert(file.file_path).second) {
                    result.push_back(file);
                }
            }
        }
        return result;
    }
}

std::vector<CacheFileEntry> select_uninstalled(const CacheCatalog& cache, const InstalledCatalog& installed) {
    std::vector<CacheFileEntry> result;
    std::ranges::copy_if(cache, std::back_inserter(result), [&](const CacheFileEntry& file) {
        return !installed.contains_name(file.identity.name);
    });
    return result;
}

std::vector<CacheFileEntry> select_excess_old(const CacheCatalog& cache, const InstalledCatalog& installed, std::size_t keep) {
    std::vector<CacheFileEntry> result;
    for (const auto& name : installed.names()) {
        auto files = cache.find_by_name(name);
        if (files.size() <= keep) continue;

        std::ranges::stable_sort(files, PackageLess{});
        const auto excess = static_cast<std::ptrdiff_t>(files.size() - keep);
        std::move(files.begin(), files.begin() + excess, std::back_inserter(result));
    }
    return result;
}

std::vector<CacheFileEntry> resolve_to_files(const std::vector<PackageIdentity>& identities, const CacheCatalog& cache) {
    return resolve(identities, cache, [](const CacheFileEntry& file, const PackageIdentity& id) {
        return same_package(file, id);
    });
}

std::vector<CacheFileEntry> resolve_to_files(const std::vector<CacheFileEntry>& packages, const CacheCatalog& cache) {
    // Entries already name a file; another file with the same identity is a
    // different copy and must not be picked up.
    return resolve(packages, cache, [](const CacheFileEntry& file, const CacheFileEntry& pkg) {
        return file.file_path == pkg.file_path && same_package(file, pkg);
    });
}

std::vector<CacheFileEntry> sort_packages(std::vector<CacheFileEntry> entries) {
    std::ranges::stable_sort(entries, PackageLess{});
    return entries;
}
