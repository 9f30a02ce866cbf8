#include "cleaner.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <filesystem>
#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    bool is_permission_error(const std::error_code& ec) {
        return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
    }
}

void print_packages(const std::vector<CacheFileEntry>& packages, std::ostream& out) {
    for (const auto& pkg : packages) {
        out << package_string(pkg) << '\n';
    }
    out.flush();
}

RemovalReport remove_packages(const std::vector<CacheFileEntry>& packages) {
    RemovalReport report;
    for (const auto& pkg : packages) {
        log_info(string_format("info.deleting", package_string(pkg)));

        std::error_code size_ec;
        const auto size = fs::file_size(pkg.file_path, size_ec);

        std::error_code ec;
        const bool removed = fs::remove(pkg.file_path, ec);
        if (ec) {
            if (is_permission_error(ec)) {
                throw DeletionPermissionDenied(string_format("error.delete_permission_denied", pkg.file_path.string()), pkg.file_path.string());
            }
            log_error(string_format("error.delete_failed", pkg.file_path.string(), ec.message()));
            ++report.failed;
        } else if (!removed) {
            log_warning(string_format("warning.already_deleted", pkg.file_path.string()));
            ++report.already_absent;
        } else {
            ++report.removed;
            if (!size_ec) report.bytes_freed += size;
        }
    }
    return report;
}

void log_removal_summary(const RemovalReport& report) {
    const double mib = static_cast<double>(report.bytes_freed) / (1024.0 * 1024.0);
    log_info(string_format("info.removal_summary", report.removed, mib));
    if (report.already_absent > 0) {
        log_info(string_format("info.removal_already_absent", report.already_absent));
    }
    if (report.failed > 0) {
        log_warning(string_format("warning.removal_failed", report.failed));
    }
}
