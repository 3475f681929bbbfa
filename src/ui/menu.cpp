#include "ui/menu.hpp"
#include "core/installer.hpp"
#include "ui/console.hpp"
#include "ui/prompt.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <spdlog/spdlog.h>

using namespace ftxui;

ManagerMenu::ManagerMenu(Installer& installer, Prompter& prompter, Console& console)
    : installer_(installer), prompter_(prompter), console_(console) {}

std::string ManagerMenu::render() const {
    auto paint = [this](Element e, Color c) { return color_ ? e | color(c) : e; };

    Elements rows;
    auto title = text(T().app_title);
    rows.push_back((color_ ? title | bold : title) | center);
    rows.push_back(separator());

    if (installer_.is_installed()) {
        rows.push_back(hbox({text(T().status_label), paint(text(T().installed), Color::Green)}));
        bool active = installer_.is_service_active();
        rows.push_back(hbox({
            text(T().service_label),
            active ? paint(text(T().running), Color::Green)
                   : paint(text(T().stopped), Color::Red),
        }));
    } else {
        rows.push_back(hbox({text(T().status_label), paint(text(T().not_installed), Color::Red)}));
    }

    rows.push_back(separator());
    const char* entries[] = {
        T().menu_install, T().menu_uninstall, T().menu_restart, T().menu_stop,
        T().menu_status, T().menu_logs, T().menu_exit,
    };
    int n = 1;
    for (const char* entry : entries) {
        rows.push_back(text(std::to_string(n++) + ". " + entry));
    }

    auto doc = vbox(std::move(rows)) | border;
    auto screen = Screen::Create(Dimension::Fixed(48), Dimension::Fit(doc));
    Render(screen, doc);
    return screen.ToString();
}

bool ManagerMenu::dispatch(const std::string& raw) {
    std::string choice = raw;
    auto first = choice.find_first_not_of(" \t");
    auto last = choice.find_last_not_of(" \t");
    choice = (first == std::string::npos) ? "" : choice.substr(first, last - first + 1);

    OperationResult result;
    if (choice == "1") {
        result = installer_.install_or_update();
    } else if (choice == "2") {
        result = installer_.uninstall();
    } else if (choice == "3") {
        result = installer_.restart_service();
    } else if (choice == "4") {
        result = installer_.stop_service();
    } else if (choice == "5") {
        result = installer_.show_status();
    } else if (choice == "6") {
        result = installer_.view_logs();
    } else if (choice == "7") {
        console_.line(T().menu_exiting);
        return false;
    } else {
        console_.warn(T().menu_invalid);
        return true;
    }

    spdlog::info("Menu option {} {}", choice,
                 result.cancelled ? "cancelled" : (result.success ? "succeeded" : "failed"));
    return true;
}

int ManagerMenu::run() {
    while (true) {
        if (clear_screen_) {
            console_.out() << "\033[2J\033[H";
        }
        console_.out() << render() << "\n";
        console_.out().flush();

        std::string choice;
        if (!prompter_.read_line(T().menu_prompt, choice)) {
            console_.line();
            console_.line(T().menu_exiting);
            return 0;
        }
        if (!dispatch(choice)) {
            return 0;
        }

        console_.line();
        prompter_.wait_for_key(T().menu_return);
    }
}
