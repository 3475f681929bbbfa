#pragma once

#include "core/command_runner.hpp"

#include <string>
#include <vector>

enum class PackageManagerKind {
    Apt,
    Yum,
    None
};

struct DependencyReport {
    enum class Status {
        Installed,       // package manager ran successfully
        AssumedPresent,  // no package manager, but every tool is on PATH
        Missing,         // no package manager and some tool is absent
        Failed           // package manager command failed
    };
    Status status = Status::Failed;
    PackageManagerKind manager = PackageManagerKind::None;
    std::vector<std::string> missing;  // tools absent from PATH (Missing only)
    CommandResult failure;             // failing command's result (Failed only)
};

class PackageManager {
public:
    explicit PackageManager(CommandRunner& runner);

    /// apt-get wins over yum when both exist
    PackageManagerKind detect();

    /// Make sure every package in `packages` is installed
    DependencyReport ensure(const std::vector<std::string>& packages);

    static const char* name(PackageManagerKind kind);

private:
    CommandRunner& runner_;
};
