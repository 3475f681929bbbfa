#pragma once

#include "core/command_runner.hpp"

#include <string>

struct ManagerConfig;

/// systemctl / journalctl for a single unit
class ServiceManager {
public:
    ServiceManager(CommandRunner& runner, const std::string& unit_name);

    // ── Queries ─────────────────────────────────────────────

    /// Unit appears in `systemctl list-units --full --all`
    bool is_known();
    bool is_active();
    bool is_enabled();

    // ── Lifecycle (one systemctl call each) ─────────────────

    CommandResult stop();
    CommandResult restart();
    CommandResult disable();
    CommandResult enable_now();
    CommandResult daemon_reload();

    /// `systemctl status`, attached to the terminal. Returns its exit code
    /// (3 for an inactive unit, which is not an error).
    int show_status();

    /// `journalctl -u <unit> -f` until the operator interrupts it
    int follow_logs();

    /// Unit file for the managed binary
    static std::string generate_unit_content(const ManagerConfig& config);

    /// Only alphanumerics, dash, underscore, dot and '@'; never "." or ".."
    static bool is_valid_unit_name(const std::string& name);

private:
    CommandRunner& runner_;
    std::string unit_;
};
