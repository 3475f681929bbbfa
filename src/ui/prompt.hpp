#pragma once

#include <istream>
#include <ostream>
#include <string>

/// Line-oriented questions on a terminal or any stream pair.
/// Terminal tricks (no echo, single key) only apply when `in` is std::cin
/// attached to a tty.
class Prompter {
public:
    Prompter(std::istream& in, std::ostream& out);

    /// Print `prompt`, read one line into `answer`. False at end of input.
    bool read_line(const std::string& prompt, std::string& answer);

    /// Empty answer (or end of input) yields `fallback`
    std::string ask(const std::string& prompt, const std::string& fallback);

    /// Like ask() but without echoing the typed characters
    std::string ask_secret(const std::string& prompt, const std::string& fallback);

    /// Only "y" or "Y" count as yes
    bool confirm(const std::string& prompt);

    /// "Press any key": one keystroke on a tty, one line otherwise
    void wait_for_key(const std::string& prompt);

private:
    std::istream& in_;
    std::ostream& out_;
    bool terminal_;
};
