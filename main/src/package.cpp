#include "package.hpp"

int compare_identity(const PackageIdentity& a, const PackageIdentity& b) {
    if (int c = a.name.compare(b.name); c != 0) return c;
    if (int c = a.version.compare(b.version); c != 0) return c;
    return a.release.compare(b.release);
}

std::string to_string(const PackageIdentity& p) {
    return p.name + "-" + p.version + "-" + p.release;
}
