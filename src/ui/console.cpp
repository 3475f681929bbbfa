#include "ui/console.hpp"

#include <spdlog/spdlog.h>

static const char* kBlue = "\033[34m";
static const char* kGreen = "\033[32m";
static const char* kYellow = "\033[33m";
static const char* kRed = "\033[31m";
static const char* kReset = "\033[0m";

Console::Console(std::ostream& out, std::ostream& err, bool color)
    : out_(out), err_(err), color_(color) {}

void Console::emit(std::ostream& os, const char* ansi, const char* tag, const std::string& msg) {
    if (color_) {
        os << ansi << tag << kReset << " " << msg << "\n";
    } else {
        os << tag << " " << msg << "\n";
    }
    os.flush();
}

void Console::info(const std::string& msg) {
    spdlog::info("{}", msg);
    emit(out_, kBlue, "[INFO]", msg);
}

void Console::success(const std::string& msg) {
    spdlog::info("{}", msg);
    emit(out_, kGreen, "[SUCCESS]", msg);
}

void Console::warn(const std::string& msg) {
    spdlog::warn("{}", msg);
    emit(out_, kYellow, "[WARN]", msg);
}

void Console::error(const std::string& msg) {
    spdlog::error("{}", msg);
    emit(err_, kRed, "[ERROR]", msg);
}

void Console::line(const std::string& msg) {
    out_ << msg << "\n";
    out_.flush();
}
