#pragma once

#include <memory>

class App {
public:
    enum class Operation {
        Install,
        Uninstall,
        Restart,
        Stop,
        Status,
        Logs
    };

    /// Loads the config file, selects the language and opens the log
    App();
    ~App();

    /// Interactive menu
    int run_menu();

    /// Single operation, exit code 0 on success
    int run_operation(Operation op);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
