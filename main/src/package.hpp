#pragma once

#include <filesystem>
#include <string>

// The four fields every package representation shares.
struct PackageIdentity {
    std::string name;
    std::string version;
    std::string release;
    std::string arch;

    bool operator==(const PackageIdentity& other) const = default;
};

// A package archive found in the cache directory.
struct CacheFileEntry {
    PackageIdentity identity;
    std::string file_name;
    std::filesystem::path file_path;
};

// A package recorded in the installed-package database.
struct InstalledRecord {
    PackageIdentity identity;
    std::string source; // local db subdirectory the record was read from
};

inline const PackageIdentity& identity_of(const PackageIdentity& p) { return p; }
inline const PackageIdentity& identity_of(const CacheFileEntry& p) { return p.identity; }
inline const PackageIdentity& identity_of(const InstalledRecord& p) { return p.identity; }

// Orders by name, then version, then release, comparing each field as a
// plain byte string ("9" sorts after "10"). The architecture is ignored.
int compare_identity(const PackageIdentity& a, const PackageIdentity& b);

template <typename A, typename B>
int compare_packages(const A& a, const B& b) {
    return compare_identity(identity_of(a), identity_of(b));
}

template <typename A, typename B>
bool same_package(const A& a, const B& b) {
    return identity_of(a) == identity_of(b);
}

struct PackageLess {
    template <typename A, typename B>
    bool operator()(const A& a, const B& b) const {
        return compare_packages(a, b) < 0;
    }
};

// "name-version-release"
std::string to_string(const PackageIdentity& p);

template <typename P>
std::string package_string(const P& p) {
    return to_string(identity_of(p));
}
