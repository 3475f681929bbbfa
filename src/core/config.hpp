#pragma once

#include <string>
#include <vector>

struct ManagerConfig {
    // Release source
    std::string github_repo = "0fariid0/Phantom-Tunnel";
    std::string api_base = "https://api.github.com";
    std::string download_base = "https://github.com";
    std::string asset_prefix = "phantom";  // <prefix>-amd64, <prefix>-arm64

    // Installed binary
    std::string install_dir = "/usr/local/bin";
    std::string executable_name = "phantom";
    std::string alias_name = "phantom-tunnel";  // compatibility symlink
    std::string working_dir = "/etc/phantom";
    std::string database_name = "config.db";    // first-run sentinel

    // Systemd
    std::string service_name = "phantom.service";
    std::string unit_dir = "/etc/systemd/system";
    int restart_sec = 5;
    int limit_nofile = 65536;
    int start_grace_seconds = 2;

    // First-run setup
    std::string default_admin_user = "admin";
    std::string default_admin_password = "admin";

    // Packages ensured before installing
    std::vector<std::string> dependencies = {"curl", "grep"};

    // Uninstall cleanup of older layouts
    std::string legacy_dir = "/root";
    std::vector<std::string> legacy_files = {
        "credentials.json",
        "config.json",
        "phantom.db",
        "license.key",
        "server.crt",
        "server.key",
    };
    std::vector<std::string> temp_files = {
        "/tmp/phantom.pid",
        "/tmp/phantom-panel.log",
        "/tmp/phantom-tunnel.log",
    };
    std::string temp_root;  // empty = system temp directory

    // Display
    std::string language = "en";
    bool color = true;

    // Diagnostics
    std::string log_file = "/var/log/phantom-manager.log";
    std::string log_level = "info";

    std::string primary_path() const;
    std::string alias_path() const;
    std::string unit_path() const;
    std::string database_path() const;

    /// Copy with every absolute path moved under `root` (sandboxing for tests)
    ManagerConfig rebased(const std::string& root) const;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool load(const std::string& path);
    bool save() const;
    bool save(const std::string& path) const;

    ManagerConfig& data();
    const ManagerConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();

private:
    ManagerConfig config_;
};
