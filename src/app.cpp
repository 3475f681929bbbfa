#include "app.hpp"
#include "core/config.hpp"
#include "core/command_runner.hpp"
#include "core/installer.hpp"
#include "core/logging.hpp"
#include "core/release_source.hpp"
#include "ui/console.hpp"
#include "ui/menu.hpp"
#include "ui/prompt.hpp"
#include "i18n/i18n.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <unistd.h>

struct App::Impl {
    Config config;
    bool config_loaded = false;
    SystemCommandRunner runner;
    std::unique_ptr<GithubReleaseSource> releases;
    std::unique_ptr<Console> console;
    Prompter prompter{std::cin, std::cout};
    std::unique_ptr<Installer> installer;

    Impl() {
        config_loaded = config.load();
        const auto& d = config.data();

        current_lang = (d.language == "zh") ? Lang::ZH : Lang::EN;

        if (!init_logging(d.log_file, d.log_level)) {
            std::cerr << "warning: cannot write log file " << d.log_file << "\n";
        }
        spdlog::info("phantom-manager starting (config {}: {})", Config::config_path(),
                     config_loaded ? "loaded" : "defaults");

        bool color = d.color && isatty(STDOUT_FILENO);
        console = std::make_unique<Console>(std::cout, std::cerr, color);
        releases = std::make_unique<GithubReleaseSource>(d.api_base);
        installer = std::make_unique<Installer>(d, runner, *releases, prompter, *console);
    }
};

App::App() : impl_(std::make_unique<Impl>()) {}

App::~App() = default;

int App::run_menu() {
    ManagerMenu menu(*impl_->installer, impl_->prompter, *impl_->console);
    menu.set_clear_screen(isatty(STDOUT_FILENO));
    menu.set_color(impl_->config.data().color && isatty(STDOUT_FILENO));
    return menu.run();
}

int App::run_operation(Operation op) {
    auto& installer = *impl_->installer;
    OperationResult result;
    switch (op) {
        case Operation::Install:   result = installer.install_or_update(); break;
        case Operation::Uninstall: result = installer.uninstall(); break;
        case Operation::Restart:   result = installer.restart_service(); break;
        case Operation::Stop:      result = installer.stop_service(); break;
        case Operation::Status:    result = installer.show_status(); break;
        case Operation::Logs:      result = installer.view_logs(); break;
    }
    return result.success ? 0 : 1;
}
