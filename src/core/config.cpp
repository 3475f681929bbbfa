#include "core/config.hpp"
#include "core/service_manager.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

// Kernel process names (comm) are truncated to TASK_COMM_LEN - 1
static const size_t kMaxProcessName = 15;

// ── Derived paths ───────────────────────────────────────────

std::string ManagerConfig::primary_path() const {
    return (fs::path(install_dir) / executable_name).string();
}

std::string ManagerConfig::alias_path() const {
    return (fs::path(install_dir) / alias_name).string();
}

std::string ManagerConfig::unit_path() const {
    return (fs::path(unit_dir) / service_name).string();
}

std::string ManagerConfig::database_path() const {
    return (fs::path(working_dir) / database_name).string();
}

static std::string rebase_path(const std::string& root, const std::string& path) {
    if (path.empty() || path[0] != '/') return path;
    return (fs::path(root) / path.substr(1)).string();
}

ManagerConfig ManagerConfig::rebased(const std::string& root) const {
    ManagerConfig out = *this;
    out.install_dir = rebase_path(root, install_dir);
    out.working_dir = rebase_path(root, working_dir);
    out.unit_dir = rebase_path(root, unit_dir);
    out.legacy_dir = rebase_path(root, legacy_dir);
    for (auto& f : out.temp_files) {
        f = rebase_path(root, f);
    }
    out.temp_root = temp_root.empty() ? (fs::path(root) / "tmp").string()
                                      : rebase_path(root, temp_root);
    if (!log_file.empty()) {
        out.log_file = rebase_path(root, log_file);
    }
    return out;
}

// ── Config file ─────────────────────────────────────────────

Config::Config() = default;
Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    return fs::path(config_path()).parent_path().string();
}

std::string Config::config_path() {
    const char* env = std::getenv("PHANTOM_MANAGER_CONFIG");
    if (env && env[0] != '\0') {
        return env;
    }
    return "/etc/phantom-manager/config.yaml";
}

static std::vector<std::string> as_string_list(const YAML::Node& node,
                                               const std::vector<std::string>& fallback) {
    if (!node || !node.IsSequence()) return fallback;
    std::vector<std::string> out;
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

bool Config::load() {
    return load(config_path());
}

bool Config::load(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);
        ManagerConfig c = config_;

        if (auto gh = root["github"]) {
            c.github_repo = gh["repo"].as<std::string>(c.github_repo);
            c.api_base = gh["api_base"].as<std::string>(c.api_base);
            c.download_base = gh["download_base"].as<std::string>(c.download_base);
            c.asset_prefix = gh["asset_prefix"].as<std::string>(c.asset_prefix);
        }

        if (auto install = root["install"]) {
            c.install_dir = install["dir"].as<std::string>(c.install_dir);
            c.executable_name = install["executable"].as<std::string>(c.executable_name);
            c.alias_name = install["alias"].as<std::string>(c.alias_name);
            c.working_dir = install["working_dir"].as<std::string>(c.working_dir);
            c.database_name = install["database"].as<std::string>(c.database_name);
        }

        for (const auto& name : {c.executable_name, c.alias_name}) {
            if (name.size() > kMaxProcessName) {
                spdlog::warn("Executable name '{}' is longer than {} characters; "
                             "uninstall cannot match its processes by name", name, kMaxProcessName);
            }
        }

        if (auto service = root["service"]) {
            c.service_name = service["name"].as<std::string>(c.service_name);
            if (!ServiceManager::is_valid_unit_name(c.service_name)) {
                spdlog::warn("Ignoring invalid service name '{}' in {}", c.service_name, path);
                c.service_name = config_.service_name;
            }
            c.unit_dir = service["unit_dir"].as<std::string>(c.unit_dir);
            c.restart_sec = service["restart_sec"].as<int>(c.restart_sec);
            c.limit_nofile = service["limit_nofile"].as<int>(c.limit_nofile);
            c.start_grace_seconds = service["start_grace_seconds"].as<int>(c.start_grace_seconds);
        }

        if (auto setup = root["setup"]) {
            c.default_admin_user = setup["default_user"].as<std::string>(c.default_admin_user);
            c.default_admin_password = setup["default_password"].as<std::string>(c.default_admin_password);
        }

        c.dependencies = as_string_list(root["dependencies"], c.dependencies);

        if (auto cleanup = root["cleanup"]) {
            c.legacy_dir = cleanup["legacy_dir"].as<std::string>(c.legacy_dir);
            c.legacy_files = as_string_list(cleanup["legacy_files"], c.legacy_files);
            c.temp_files = as_string_list(cleanup["temp_files"], c.temp_files);
            c.temp_root = cleanup["temp_root"].as<std::string>(c.temp_root);
        }

        if (auto display = root["display"]) {
            c.language = display["language"].as<std::string>(c.language);
            c.color = display["color"].as<bool>(c.color);
        }

        if (auto log = root["log"]) {
            c.log_file = log["file"].as<std::string>(c.log_file);
            c.log_level = log["level"].as<std::string>(c.log_level);
        }

        config_ = std::move(c);
        return true;
    } catch (const YAML::Exception& e) {
        spdlog::warn("Ignoring malformed config {}: {}", path, e.what());
        return false;
    }
}

bool Config::save() const {
    return save(config_path());
}

bool Config::save(const std::string& path) const {
    if (path.empty()) return false;

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "github" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "repo" << YAML::Value << config_.github_repo;
    out << YAML::Key << "api_base" << YAML::Value << config_.api_base;
    out << YAML::Key << "download_base" << YAML::Value << config_.download_base;
    out << YAML::Key << "asset_prefix" << YAML::Value << config_.asset_prefix;
    out << YAML::EndMap;

    out << YAML::Key << "install" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "dir" << YAML::Value << config_.install_dir;
    out << YAML::Key << "executable" << YAML::Value << config_.executable_name;
    out << YAML::Key << "alias" << YAML::Value << config_.alias_name;
    out << YAML::Key << "working_dir" << YAML::Value << config_.working_dir;
    out << YAML::Key << "database" << YAML::Value << config_.database_name;
    out << YAML::EndMap;

    out << YAML::Key << "service" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << config_.service_name;
    out << YAML::Key << "unit_dir" << YAML::Value << config_.unit_dir;
    out << YAML::Key << "restart_sec" << YAML::Value << config_.restart_sec;
    out << YAML::Key << "limit_nofile" << YAML::Value << config_.limit_nofile;
    out << YAML::Key << "start_grace_seconds" << YAML::Value << config_.start_grace_seconds;
    out << YAML::EndMap;

    out << YAML::Key << "setup" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "default_user" << YAML::Value << config_.default_admin_user;
    out << YAML::Key << "default_password" << YAML::Value << config_.default_admin_password;
    out << YAML::EndMap;

    out << YAML::Key << "dependencies" << YAML::Value << config_.dependencies;

    out << YAML::Key << "cleanup" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "legacy_dir" << YAML::Value << config_.legacy_dir;
    out << YAML::Key << "legacy_files" << YAML::Value << config_.legacy_files;
    out << YAML::Key << "temp_files" << YAML::Value << config_.temp_files;
    out << YAML::Key << "temp_root" << YAML::Value << config_.temp_root;
    out << YAML::EndMap;

    out << YAML::Key << "display" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "language" << YAML::Value << config_.language;
    out << YAML::Key << "color" << YAML::Value << config_.color;
    out << YAML::EndMap;

    out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "file" << YAML::Value << config_.log_file;
    out << YAML::Key << "level" << YAML::Value << config_.log_level;
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    std::ofstream fout(path);
    if (!fout.is_open()) return false;
    fout << out.c_str() << "\n";
    return fout.good();
}

ManagerConfig& Config::data() { return config_; }
const ManagerConfig& Config::data() const { return config_; }
