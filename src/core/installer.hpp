#pragma once

#include "core/config.hpp"
#include "core/service_manager.hpp"

#include <string>
#include <vector>

class CommandRunner;
class ReleaseSource;
class Prompter;
class Console;

struct OperationResult {
    bool success = false;
    bool cancelled = false;   // declined by the operator, nothing changed
    std::string message;
};

/// Values collected on first install and handed to the binary's setup flags
struct SetupAnswers {
    std::string port;
    std::string username;
    std::string password;
};

// ── Installer class ────────────────────────────────────────────

class Installer {
public:
    Installer(const ManagerConfig& config,
              CommandRunner& runner,
              ReleaseSource& releases,
              Prompter& prompter,
              Console& console);

    // ── Operations (one per menu entry) ─────────────────────

    /// Dependencies -> arch -> tag -> download -> stop -> install binary
    /// -> unit file -> first-run setup -> enable --now -> verify
    OperationResult install_or_update();

    /// Confirmed, idempotent removal of everything install created, plus
    /// legacy files and temp files
    OperationResult uninstall();

    OperationResult restart_service();
    OperationResult stop_service();
    OperationResult show_status();
    OperationResult view_logs();

    // ── State ───────────────────────────────────────────────

    /// Primary executable exists
    bool is_installed() const;

    /// Configuration database exists (first-run setup already done)
    bool has_database() const;

    bool is_service_active();

    /// `uname -m` of this host
    static std::string detect_machine();

    /// Replace the detected machine string (used by tests)
    void set_machine(const std::string& machine) { machine_ = machine; }

    /// ^[0-9]+$
    static bool is_valid_port(const std::string& port);

    /// Argument vector of the one-time setup invocation
    static std::vector<std::string> setup_command(const std::string& binary_path,
                                                  const SetupAnswers& answers);

private:
    ManagerConfig config_;
    CommandRunner& runner_;
    ReleaseSource& releases_;
    Prompter& prompter_;
    Console& console_;
    ServiceManager service_;
    std::string machine_;

    OperationResult fail(const std::string& msg);
    OperationResult fail_command(const CommandResult& res, const std::string& what);
    bool require_installed();
    bool require_valid_unit();

    bool ensure_dependencies(std::string& error);
    bool place_binary(const std::string& downloaded, std::string& error);
    bool write_unit_file(std::string& error);
    bool collect_setup(SetupAnswers& answers);
    bool remove_path(const std::string& path, bool recursive, std::string& error);
};
