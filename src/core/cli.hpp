#pragma once

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -1 if no subcommand (caller should launch the menu).
    static int run(int argc, char* argv[]);

    /// Print the root error and return false unless euid is 0
    static bool ensure_root();

private:
    static int cmd_help();
    static int cmd_version();
};
