#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class PacsweepException : public std::runtime_error {
public:
    explicit PacsweepException(const std::string& message)
        : std::runtime_error(message) {}
};

// Catalog errors. All of them abort the run before anything is deleted.
class CacheUnreadable : public PacsweepException {
public:
    CacheUnreadable(const std::string& message, std::string path)
        : PacsweepException(message), path_(std::move(path)) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

class InstalledDbUnreadable : public PacsweepException {
public:
    InstalledDbUnreadable(const std::string& message, std::string path)
        : PacsweepException(message), path_(std::move(path)) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

class MalformedCacheFilename : public PacsweepException {
public:
    MalformedCacheFilename(const std::string& message, std::string file_name)
        : PacsweepException(message), file_name_(std::move(file_name)) {}
    const std::string& file_name() const { return file_name_; }
private:
    std::string file_name_;
};

class MalformedInstalledRecord : public PacsweepException {
public:
    MalformedInstalledRecord(const std::string& message, std::string source)
        : PacsweepException(message), source_(std::move(source)) {}
    const std::string& source() const { return source_; }
private:
    std::string source_;
};

// Raised on EACCES/EPERM while deleting; stops the deletion run.
class DeletionPermissionDenied : public PacsweepException {
public:
    DeletionPermissionDenied(const std::string& message, std::string path)
        : PacsweepException(message), path_(std::move(path)) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};
