#pragma once

#include <ostream>
#include <string>

class Installer;
class Prompter;
class Console;

/// Numbered main menu. One state ("awaiting choice"); entries 1-6 run an
/// operation and come back, 7 (or end of input) leaves.
class ManagerMenu {
public:
    ManagerMenu(Installer& installer, Prompter& prompter, Console& console);

    /// Loop until exit. Returns the process exit code.
    int run();

    /// Run one menu entry. Returns false when the menu should end.
    bool dispatch(const std::string& choice);

    /// Banner + options as printable text
    std::string render() const;

    /// Clear the terminal before each redraw
    void set_clear_screen(bool clear) { clear_screen_ = clear; }

    /// Styled banner (bold title, green/red state). Off = plain text only.
    void set_color(bool color) { color_ = color; }

private:
    Installer& installer_;
    Prompter& prompter_;
    Console& console_;
    bool clear_screen_ = false;
    bool color_ = true;
};
