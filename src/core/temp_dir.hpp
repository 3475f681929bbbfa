#pragma once

#include <string>

/// Directory created with mkdtemp() and removed recursively when the
/// owner goes out of scope, whichever way the scope is left.
class ScopedTempDir {
public:
    /// parent empty = system temp directory
    explicit ScopedTempDir(const std::string& parent = "",
                           const std::string& prefix = "phantom-manager-");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    /// False if the directory could not be created
    bool valid() const { return !path_.empty(); }

    const std::string& path() const { return path_; }

    /// Remove now (idempotent)
    void remove();

private:
    std::string path_;
};
