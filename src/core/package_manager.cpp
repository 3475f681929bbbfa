#include "core/package_manager.hpp"

#include <spdlog/spdlog.h>

PackageManager::PackageManager(CommandRunner& runner) : runner_(runner) {}

const char* PackageManager::name(PackageManagerKind kind) {
    switch (kind) {
        case PackageManagerKind::Apt: return "apt-get";
        case PackageManagerKind::Yum: return "yum";
        case PackageManagerKind::None: break;
    }
    return "none";
}

PackageManagerKind PackageManager::detect() {
    if (runner_.has_command("apt-get")) return PackageManagerKind::Apt;
    if (runner_.has_command("yum")) return PackageManagerKind::Yum;
    return PackageManagerKind::None;
}

DependencyReport PackageManager::ensure(const std::vector<std::string>& packages) {
    DependencyReport report;
    report.manager = detect();

    auto fail = [&report](CommandResult res) {
        report.status = DependencyReport::Status::Failed;
        report.failure = std::move(res);
        return report;
    };

    switch (report.manager) {
        case PackageManagerKind::Apt: {
            auto update = runner_.run({"apt-get", "update", "-y"});
            if (!update.ok()) return fail(std::move(update));

            std::vector<std::string> cmd = {"apt-get", "install", "-y", "-qq"};
            cmd.insert(cmd.end(), packages.begin(), packages.end());
            auto install = runner_.run(cmd);
            if (!install.ok()) return fail(std::move(install));
            break;
        }
        case PackageManagerKind::Yum: {
            std::vector<std::string> cmd = {"yum", "install", "-y"};
            cmd.insert(cmd.end(), packages.begin(), packages.end());
            auto install = runner_.run(cmd);
            if (!install.ok()) return fail(std::move(install));
            break;
        }
        case PackageManagerKind::None: {
            for (const auto& pkg : packages) {
                if (!runner_.has_command(pkg)) {
                    report.missing.push_back(pkg);
                }
            }
            report.status = report.missing.empty()
                ? DependencyReport::Status::AssumedPresent
                : DependencyReport::Status::Missing;
            spdlog::warn("No supported package manager; {} of {} dependencies missing",
                         report.missing.size(), packages.size());
            return report;
        }
    }

    report.status = DependencyReport::Status::Installed;
    spdlog::info("Dependencies ensured with {}", name(report.manager));
    return report;
}
