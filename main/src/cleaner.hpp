#pragma once

#include "package.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

struct RemovalReport {
    std::size_t removed = 0;
    std::size_t already_absent = 0;
    std::size_t failed = 0;
    std::uintmax_t bytes_freed = 0;
};

// One "name-version-release" line per entry.
void print_packages(const std::vector<CacheFileEntry>& packages, std::ostream& out);

// Deletes each entry's file. A file that is already gone counts as done.
// Throws DeletionPermissionDenied on the first permission failure, leaving
// the remaining files untouched.
RemovalReport remove_packages(const std::vector<CacheFileEntry>& packages);

void log_removal_summary(const RemovalReport& report);
