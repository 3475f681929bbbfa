#include "core/cli.hpp"
#include "core/config.hpp"
#include "ui/console.hpp"
#include "i18n/i18n.hpp"
#include "app.hpp"

#include <cstring>
#include <iostream>
#include <unistd.h>

#ifndef PHANTOM_MANAGER_VERSION
#define PHANTOM_MANAGER_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

struct OperationCommand {
    const char* name;
    App::Operation op;
};

static const OperationCommand kOperations[] = {
    {"install", App::Operation::Install},
    {"uninstall", App::Operation::Uninstall},
    {"restart", App::Operation::Restart},
    {"stop", App::Operation::Stop},
    {"status", App::Operation::Status},
    {"logs", App::Operation::Logs},
};

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → menu

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "menu") == 0) {
        return -1;
    }

    for (const auto& entry : kOperations) {
        if (std::strcmp(cmd, entry.name) == 0) {
            if (argc > 2) {
                std::cerr << "'" << cmd << "' takes no arguments\n";
                return 1;
            }
            if (!ensure_root()) return 1;
            App app;
            return app.run_operation(entry.op);
        }
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'phantom-manager help' for usage.\n";
    return 1;
}

bool CLI::ensure_root() {
    if (Config::is_privileged()) return true;
    Console console(std::cout, std::cerr, isatty(STDERR_FILENO));
    console.error(T().root_required);
    return false;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "phantom-manager - install and manage the Phantom Tunnel service\n"
        "\n"
        "Usage:\n"
        "  phantom-manager              Interactive menu (default)\n"
        "  phantom-manager install      Install or update Phantom Tunnel\n"
        "  phantom-manager uninstall    Remove Phantom Tunnel completely\n"
        "  phantom-manager restart      Restart the service\n"
        "  phantom-manager stop         Stop the service\n"
        "  phantom-manager status       Show the service status\n"
        "  phantom-manager logs         Follow the service logs (Ctrl+C to stop)\n"
        "  phantom-manager version      Show version\n"
        "  phantom-manager help         Show this help\n"
        "\n"
        "All commands except help and version must run as root.\n"
        "\n"
        "Configuration: /etc/phantom-manager/config.yaml\n"
        "  (override with PHANTOM_MANAGER_CONFIG=/path/to/config.yaml)\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "phantom-manager " << PHANTOM_MANAGER_VERSION << "\n";
    return 0;
}
