#include "core/temp_dir.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

ScopedTempDir::ScopedTempDir(const std::string& parent, const std::string& prefix) {
    std::error_code ec;
    fs::path base = parent.empty() ? fs::temp_directory_path(ec) : fs::path(parent);
    if (ec) {
        spdlog::error("No temp directory available: {}", ec.message());
        return;
    }
    fs::create_directories(base, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", base.string(), ec.message());
        return;
    }

    std::string tmpl = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        spdlog::error("mkdtemp({}) failed: {}", tmpl, std::strerror(errno));
        return;
    }
    path_ = buf.data();
    spdlog::debug("Created temp dir {}", path_);
}

ScopedTempDir::~ScopedTempDir() {
    remove();
}

void ScopedTempDir::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp dir {}: {}", path_, ec.message());
    } else {
        spdlog::debug("Removed temp dir {}", path_);
    }
    path_.clear();
}
