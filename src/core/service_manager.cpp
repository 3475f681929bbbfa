#include "core/service_manager.hpp"
#include "core/config.hpp"

#include <cctype>
#include <sstream>

ServiceManager::ServiceManager(CommandRunner& runner, const std::string& unit_name)
    : runner_(runner), unit_(unit_name) {}

bool ServiceManager::is_valid_unit_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '-' && c != '_' && c != '.' && c != '@') {
            return false;
        }
    }
    return true;
}

// ── Queries ─────────────────────────────────────────────────

bool ServiceManager::is_known() {
    auto res = runner_.run({"systemctl", "list-units", "--full", "--all",
                            "--plain", "--no-legend", unit_});
    if (!res.ok()) return false;
    return res.output.find(unit_) != std::string::npos;
}

bool ServiceManager::is_active() {
    return runner_.run({"systemctl", "is-active", "--quiet", unit_}).ok();
}

bool ServiceManager::is_enabled() {
    return runner_.run({"systemctl", "is-enabled", "--quiet", unit_}).ok();
}

// ── Lifecycle ───────────────────────────────────────────────

CommandResult ServiceManager::stop() {
    return runner_.run({"systemctl", "stop", unit_});
}

CommandResult ServiceManager::restart() {
    return runner_.run({"systemctl", "restart", unit_});
}

CommandResult ServiceManager::disable() {
    return runner_.run({"systemctl", "disable", unit_});
}

CommandResult ServiceManager::enable_now() {
    return runner_.run({"systemctl", "enable", "--now", unit_});
}

CommandResult ServiceManager::daemon_reload() {
    return runner_.run({"systemctl", "daemon-reload"});
}

int ServiceManager::show_status() {
    return runner_.run_interactive({"systemctl", "status", unit_});
}

int ServiceManager::follow_logs() {
    return runner_.run_interactive({"journalctl", "-u", unit_, "-f"});
}

// ── Unit file ───────────────────────────────────────────────

std::string ServiceManager::generate_unit_content(const ManagerConfig& config) {
    std::ostringstream ss;
    ss << "[Unit]\n"
       << "Description=Phantom Tunnel Panel Service\n"
       << "After=network-online.target\n"
       << "Wants=network-online.target\n"
       << "\n"
       << "[Service]\n"
       << "ExecStart=\"" << config.primary_path() << "\" --start-panel\n"
       << "WorkingDirectory=" << config.working_dir << "\n"
       << "Restart=always\n"
       << "RestartSec=" << config.restart_sec << "\n"
       << "LimitNOFILE=" << config.limit_nofile << "\n"
       << "User=root\n"
       << "Group=root\n"
       << "\n"
       << "[Install]\n"
       << "WantedBy=multi-user.target\n";
    return ss.str();
}
