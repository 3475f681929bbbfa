#include "ui/prompt.hpp"

#include <cerrno>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace {

/// Applies a termios change to stdin and restores it on scope exit
class TerminalMode {
public:
    explicit TerminalMode(tcflag_t clear_lflags) {
        if (tcgetattr(STDIN_FILENO, &saved_) != 0) return;
        termios changed = saved_;
        changed.c_lflag &= ~clear_lflags;
        if (clear_lflags & ICANON) {
            changed.c_cc[VMIN] = 1;
            changed.c_cc[VTIME] = 0;
        }
        active_ = tcsetattr(STDIN_FILENO, TCSANOW, &changed) == 0;
    }
    ~TerminalMode() {
        if (active_) tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    }

    TerminalMode(const TerminalMode&) = delete;
    TerminalMode& operator=(const TerminalMode&) = delete;

private:
    termios saved_{};
    bool active_ = false;
};

}  // namespace

Prompter::Prompter(std::istream& in, std::ostream& out)
    : in_(in), out_(out), terminal_(&in == &std::cin && isatty(STDIN_FILENO)) {}

bool Prompter::read_line(const std::string& prompt, std::string& answer) {
    out_ << prompt;
    out_.flush();
    if (!std::getline(in_, answer)) {
        answer.clear();
        return false;
    }
    if (!answer.empty() && answer.back() == '\r') {
        answer.pop_back();
    }
    return true;
}

std::string Prompter::ask(const std::string& prompt, const std::string& fallback) {
    std::string answer;
    if (!read_line(prompt, answer) || answer.empty()) {
        return fallback;
    }
    return answer;
}

std::string Prompter::ask_secret(const std::string& prompt, const std::string& fallback) {
    std::string answer;
    bool got = false;
    if (terminal_) {
        TerminalMode no_echo(ECHO);
        got = read_line(prompt, answer);
    } else {
        got = read_line(prompt, answer);
    }
    // The user's Enter was not echoed
    out_ << "\n";
    out_.flush();
    if (!got || answer.empty()) {
        return fallback;
    }
    return answer;
}

bool Prompter::confirm(const std::string& prompt) {
    std::string answer;
    if (!read_line(prompt, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y";
}

void Prompter::wait_for_key(const std::string& prompt) {
    out_ << prompt;
    out_.flush();
    if (terminal_) {
        TerminalMode raw(ICANON | ECHO);
        char c;
        while (read(STDIN_FILENO, &c, 1) < 0 && errno == EINTR) {
        }
    } else {
        std::string discard;
        std::getline(in_, discard);
    }
    out_ << "\n";
    out_.flush();
}
