#include "core/installer.hpp"
#include "core/command_runner.hpp"
#include "core/package_manager.hpp"
#include "core/release_source.hpp"
#include "core/temp_dir.hpp"
#include "ui/console.hpp"
#include "ui/prompt.hpp"
#include "i18n/i18n.hpp"

#include <spdlog/spdlog.h>
#include <sys/utsname.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <regex>
#include <thread>

namespace fs = std::filesystem;

static const char* kRule = "------------------------------------------------------------";

static std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

/// Anything at `path`, including a dangling symlink
static bool path_present(const std::string& path) {
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    return !ec && st.type() != fs::file_type::not_found;
}

Installer::Installer(const ManagerConfig& config,
                     CommandRunner& runner,
                     ReleaseSource& releases,
                     Prompter& prompter,
                     Console& console)
    : config_(config),
      runner_(runner),
      releases_(releases),
      prompter_(prompter),
      console_(console),
      service_(runner, config.service_name),
      machine_(detect_machine()) {}

// ════════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════════

std::string Installer::detect_machine() {
    struct utsname uts;
    if (uname(&uts) != 0) {
        return "";
    }
    return uts.machine;
}

bool Installer::is_valid_port(const std::string& port) {
    static const std::regex digits("[0-9]+");
    return std::regex_match(port, digits);
}

std::vector<std::string> Installer::setup_command(const std::string& binary_path,
                                                  const SetupAnswers& answers) {
    return {
        binary_path,
        "--setup-port=" + answers.port,
        "--setup-user=" + answers.username,
        "--setup-pass=" + answers.password,
    };
}

bool Installer::is_installed() const {
    std::error_code ec;
    return fs::exists(config_.primary_path(), ec);
}

bool Installer::has_database() const {
    std::error_code ec;
    return fs::exists(config_.database_path(), ec);
}

bool Installer::is_service_active() {
    return service_.is_active();
}

OperationResult Installer::fail(const std::string& msg) {
    console_.error(msg);
    OperationResult result;
    result.success = false;
    result.message = msg;
    return result;
}

OperationResult Installer::fail_command(const CommandResult& res, const std::string& what) {
    std::string msg = std::string(T().command_failed) + what +
                      " (exit " + std::to_string(res.exit_code) + ")";
    if (!res.output.empty()) {
        msg += ": " + res.output;
    }
    return fail(msg);
}

bool Installer::require_valid_unit() {
    if (ServiceManager::is_valid_unit_name(config_.service_name)) return true;
    console_.error(std::string(T().invalid_service_name) + config_.service_name);
    return false;
}

bool Installer::require_installed() {
    if (!require_valid_unit()) return false;
    if (is_installed()) return true;
    console_.error(T().not_installed_error);
    return false;
}

bool Installer::remove_path(const std::string& path, bool recursive, std::string& error) {
    std::error_code ec;
    if (recursive) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec) {
        error = std::string(T().remove_failed) + path + ": " + ec.message();
        return false;
    }
    return true;
}

// ════════════════════════════════════════════════════════════════
// Install / update
// ════════════════════════════════════════════════════════════════

bool Installer::ensure_dependencies(std::string& error) {
    const auto& deps = config_.dependencies;
    console_.info(std::string(T().deps_checking) + join(deps, ", "));

    PackageManager pm(runner_);
    auto report = pm.ensure(deps);

    switch (report.status) {
        case DependencyReport::Status::Installed:
            break;
        case DependencyReport::Status::AssumedPresent:
            console_.warn(std::string(T().deps_assumed) + join(deps, ", "));
            break;
        case DependencyReport::Status::Missing:
            error = std::string(T().deps_missing) + join(report.missing, ", ");
            return false;
        case DependencyReport::Status::Failed:
            error = std::string(T().deps_failed) + PackageManager::name(report.manager) +
                    " (exit " + std::to_string(report.failure.exit_code) + ")";
            if (!report.failure.output.empty()) {
                error += ": " + report.failure.output;
            }
            return false;
    }

    console_.success(T().deps_ok);
    return true;
}

bool Installer::place_binary(const std::string& downloaded, std::string& error) {
    std::error_code ec;

    for (const auto& dir : {config_.working_dir, config_.install_dir}) {
        fs::create_directories(dir, ec);
        if (ec) {
            error = dir + ": " + ec.message();
            return false;
        }
    }

    const std::string primary = config_.primary_path();
    fs::rename(downloaded, primary, ec);
    if (ec == std::errc::cross_device_link) {
        // Temp dir on another filesystem: copy, then drop the source
        ec.clear();
        fs::copy_file(downloaded, primary, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::remove(downloaded, ec);
        }
    }
    if (ec) {
        error = primary + ": " + ec.message();
        return false;
    }

    fs::permissions(primary,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        error = primary + ": " + ec.message();
        return false;
    }

    // ln -sf
    const std::string alias = config_.alias_path();
    if (path_present(alias)) {
        fs::remove(alias, ec);
        if (ec) {
            error = alias + ": " + ec.message();
            return false;
        }
    }
    fs::create_symlink(primary, alias, ec);
    if (ec) {
        error = alias + ": " + ec.message();
        return false;
    }

    spdlog::info("Installed {} (alias {})", primary, alias);
    return true;
}

bool Installer::write_unit_file(std::string& error) {
    std::error_code ec;
    fs::create_directories(config_.unit_dir, ec);
    if (ec) {
        error = config_.unit_dir + ": " + ec.message();
        return false;
    }

    const std::string path = config_.unit_path();
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        error = path;
        return false;
    }
    out << ServiceManager::generate_unit_content(config_);
    out.close();
    if (!out) {
        error = path;
        return false;
    }
    return true;
}

bool Installer::collect_setup(SetupAnswers& answers) {
    std::string port;
    prompter_.read_line(T().setup_port_prompt, port);
    if (!is_valid_port(port)) {
        return false;
    }
    answers.port = port;

    answers.username = prompter_.ask(
        std::string(T().setup_user_prompt) + config_.default_admin_user + "]: ",
        config_.default_admin_user);
    answers.password = prompter_.ask_secret(
        std::string(T().setup_pass_prompt) + config_.default_admin_password + "]: ",
        config_.default_admin_password);
    return true;
}

OperationResult Installer::install_or_update() {
    console_.info(T().install_start);

    if (!require_valid_unit()) {
        return OperationResult{false, false, T().invalid_service_name + config_.service_name};
    }

    // Architecture first: an unsupported host touches neither network nor disk
    const std::string asset = ReleaseSource::asset_for_machine(config_.asset_prefix, machine_);
    if (asset.empty()) {
        return fail(std::string(T().arch_unsupported) + machine_ + ".");
    }

    std::string error;
    if (!ensure_dependencies(error)) {
        return fail(error);
    }

    console_.info(T().fetching_tag);
    const std::string tag = releases_.latest_tag(config_.github_repo);
    if (tag.empty()) {
        return fail(T().tag_failed);
    }
    console_.info(std::string(T().latest_version) + tag + ".");

    const std::string url =
        ReleaseSource::download_url(config_.download_base, config_.github_repo, tag, asset);

    console_.info(std::string(T().downloading) + asset + " (" + machine_ + ")");
    ScopedTempDir tmp(config_.temp_root);
    if (!tmp.valid()) {
        return fail(T().tempdir_failed);
    }
    const std::string downloaded = (fs::path(tmp.path()) / config_.executable_name).string();
    if (!releases_.download(url, downloaded) || !fs::exists(downloaded)) {
        return fail(T().download_failed);
    }
    console_.success(T().download_ok);

    if (service_.is_active()) {
        console_.warn(T().stopping_for_update);
        auto res = service_.stop();
        if (!res.ok()) return fail_command(res, "systemctl stop " + config_.service_name);
    }

    console_.info(std::string(T().installing_to) + config_.install_dir + "...");
    if (!place_binary(downloaded, error)) {
        return fail(std::string(T().install_failed) + error);
    }
    console_.success(T().binary_installed);

    console_.info(T().configuring_service);
    if (!write_unit_file(error)) {
        return fail(std::string(T().unit_write_failed) + error);
    }
    auto reload = service_.daemon_reload();
    if (!reload.ok()) return fail_command(reload, "systemctl daemon-reload");
    console_.success(T().unit_written);

    if (!has_database()) {
        console_.info(T().setup_first_run);
        SetupAnswers answers;
        if (!collect_setup(answers)) {
            return fail(T().setup_port_invalid);
        }

        console_.info(T().setup_running);
        int code = runner_.run_interactive(setup_command(config_.primary_path(), answers));
        if (code != 0) {
            return fail(std::string(T().setup_failed) + std::to_string(code));
        }
    } else {
        console_.info(T().setup_skipped);
    }

    console_.info(T().enabling);
    auto enable = service_.enable_now();
    if (!enable.ok()) return fail_command(enable, "systemctl enable --now " + config_.service_name);
    console_.success(T().enabled);

    console_.line();
    console_.success(T().install_complete);
    console_.line(kRule);
    if (config_.start_grace_seconds > 0) {
        std::this_thread::sleep_for(std::chrono::seconds(config_.start_grace_seconds));
    }

    OperationResult result;
    if (service_.is_active()) {
        console_.success(T().now_running);
        result.success = true;
        result.message = T().now_running;
    } else {
        result = fail(std::string(T().start_failed) + config_.service_name);
    }
    console_.line(kRule);
    return result;
}

// ════════════════════════════════════════════════════════════════
// Uninstall
// ════════════════════════════════════════════════════════════════

OperationResult Installer::uninstall() {
    if (!require_valid_unit()) {
        return OperationResult{false, false, T().invalid_service_name + config_.service_name};
    }

    console_.line("----------------------------------------------");
    console_.line(std::string("--- ") + T().uninstall_title + " ---");
    console_.line("----------------------------------------------");
    console_.warn(T().uninstall_warning);
    console_.line();

    if (!prompter_.confirm(T().uninstall_confirm)) {
        console_.line(T().uninstall_cancelled);
        OperationResult result;
        result.success = true;
        result.cancelled = true;
        result.message = T().uninstall_cancelled;
        return result;
    }

    // Step 1: service
    console_.info(T().uninstall_stopping);
    if (service_.is_known()) {
        if (service_.is_active()) {
            auto res = service_.stop();
            if (!res.ok()) return fail_command(res, "systemctl stop " + config_.service_name);
            console_.info(T().service_stopped);
        }
        if (service_.is_enabled()) {
            auto res = service_.disable();
            if (!res.ok()) return fail_command(res, "systemctl disable " + config_.service_name);
            console_.info(T().service_disabled);
        }
    } else {
        console_.warn(T().service_not_found);
    }

    // Step 2: stray processes. Exact name match so this manager is never hit.
    console_.info(T().killing_processes);
    for (const auto& name : {config_.executable_name, config_.alias_name}) {
        auto res = runner_.run({"pkill", "-x", name});
        if (res.exit_code > 1) {
            spdlog::warn("pkill -x {} exited with {}", name, res.exit_code);
        }
    }

    std::string error;

    // Step 3: unit file
    if (path_present(config_.unit_path())) {
        console_.info(T().removing_unit);
        if (!remove_path(config_.unit_path(), false, error)) return fail(error);
        auto reload = service_.daemon_reload();
        if (!reload.ok()) return fail_command(reload, "systemctl daemon-reload");
        console_.info(T().daemon_reloaded);
    }

    // Step 4: executables (the alias may dangle by now)
    for (const auto& path : {config_.primary_path(), config_.alias_path()}) {
        if (path_present(path)) {
            console_.info(std::string(T().removing_executable) + path);
            if (!remove_path(path, false, error)) return fail(error);
        }
    }

    // Step 5: working directory
    if (path_present(config_.working_dir)) {
        console_.info(std::string(T().removing_working_dir) + config_.working_dir);
        if (!remove_path(config_.working_dir, true, error)) return fail(error);
    }

    // Step 6: legacy layout
    console_.info(std::string(T().searching_legacy) + config_.legacy_dir + "...");
    for (const auto& file : config_.legacy_files) {
        std::string path = (fs::path(config_.legacy_dir) / file).string();
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            console_.info(std::string(T().removing_legacy) + path);
            if (!remove_path(path, false, error)) return fail(error);
        }
    }

    // Step 7: temp files
    console_.info(T().cleaning_temp);
    for (const auto& path : config_.temp_files) {
        if (path_present(path) && !remove_path(path, false, error)) {
            return fail(error);
        }
    }

    console_.line();
    console_.success(T().uninstall_complete);
    console_.line(T().uninstall_manual_hint);

    OperationResult result;
    result.success = true;
    result.message = T().uninstall_complete;
    return result;
}

// ════════════════════════════════════════════════════════════════
// Service management
// ════════════════════════════════════════════════════════════════

OperationResult Installer::restart_service() {
    if (!require_installed()) {
        return OperationResult{false, false, T().not_installed_error};
    }
    console_.info(T().restarting);
    auto res = service_.restart();
    if (!res.ok()) return fail_command(res, "systemctl restart " + config_.service_name);
    console_.success(T().restarted);
    return OperationResult{true, false, T().restarted};
}

OperationResult Installer::stop_service() {
    if (!require_installed()) {
        return OperationResult{false, false, T().not_installed_error};
    }
    console_.info(T().stopping);
    auto res = service_.stop();
    if (!res.ok()) return fail_command(res, "systemctl stop " + config_.service_name);
    console_.success(T().service_stopped);
    return OperationResult{true, false, T().service_stopped};
}

OperationResult Installer::show_status() {
    if (!require_installed()) {
        return OperationResult{false, false, T().not_installed_error};
    }
    console_.info(T().showing_status);
    int code = service_.show_status();
    // Non-zero only means "not running"; 127 means systemctl itself is missing
    if (code < 0 || code == 127) {
        return fail(std::string(T().command_failed) + "systemctl status " + config_.service_name);
    }
    return OperationResult{true, false, ""};
}

OperationResult Installer::view_logs() {
    if (!require_installed()) {
        return OperationResult{false, false, T().not_installed_error};
    }
    console_.info(T().showing_logs);
    int code = service_.follow_logs();
    if (code < 0 || code == 127) {
        return fail(std::string(T().command_failed) + "journalctl -u " + config_.service_name);
    }
    return OperationResult{true, false, ""};
}
