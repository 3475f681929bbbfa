#pragma once

#include <ostream>
#include <string>

/// Prefixed status lines: [INFO] [SUCCESS] [WARN] on `out`, [ERROR] on `err`.
/// Each line is mirrored into the diagnostic log.
class Console {
public:
    Console(std::ostream& out, std::ostream& err, bool color = true);

    void info(const std::string& msg);
    void success(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    /// Unprefixed line on `out`
    void line(const std::string& msg = "");

    std::ostream& out() { return out_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    bool color_;

    void emit(std::ostream& os, const char* ansi, const char* tag, const std::string& msg);
};
