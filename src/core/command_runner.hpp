#pragma once

#include <string>
#include <vector>

struct CommandResult {
    int exit_code = -1;     // 127 when the program could not be executed
    std::string output;     // combined stdout + stderr, trailing newlines trimmed

    bool ok() const { return exit_code == 0; }
};

/// Seam between the operations and the host system. Everything that would
/// otherwise be a shell-out goes through here, so tests can script results.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Run argv[0] (PATH lookup) with its output captured
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;

    /// Run attached to the terminal (status pages, log streams, prompts of
    /// the child). Returns the exit code.
    virtual int run_interactive(const std::vector<std::string>& argv) = 0;

    /// True if `name` resolves to an executable on PATH
    virtual bool has_command(const std::string& name) = 0;

    /// Render argv for logs, masking secrets passed as --setup-pass=
    static std::string describe(const std::vector<std::string>& argv);
};

class SystemCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv) override;
    int run_interactive(const std::vector<std::string>& argv) override;
    bool has_command(const std::string& name) override;
};
