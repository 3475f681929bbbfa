#pragma once

#include <atomic>

enum class Lang { EN, ZH };

struct Strings {
    // General
    const char* app_title;
    const char* status_label;
    const char* service_label;
    const char* installed;
    const char* not_installed;
    const char* running;
    const char* stopped;

    // Menu
    const char* menu_install;
    const char* menu_uninstall;
    const char* menu_restart;
    const char* menu_stop;
    const char* menu_status;
    const char* menu_logs;
    const char* menu_exit;
    const char* menu_prompt;
    const char* menu_invalid;
    const char* menu_return;
    const char* menu_exiting;

    // Install: dependencies
    const char* install_start;
    const char* deps_checking;
    const char* deps_ok;
    const char* deps_assumed;
    const char* deps_missing;
    const char* deps_failed;

    // Install: release
    const char* arch_unsupported;
    const char* fetching_tag;
    const char* tag_failed;
    const char* latest_version;
    const char* downloading;
    const char* download_failed;
    const char* download_ok;
    const char* tempdir_failed;

    // Install: files and unit
    const char* stopping_for_update;
    const char* installing_to;
    const char* install_failed;
    const char* binary_installed;
    const char* configuring_service;
    const char* unit_write_failed;
    const char* unit_written;

    // Install: first-run setup
    const char* setup_first_run;
    const char* setup_port_prompt;
    const char* setup_port_invalid;
    const char* setup_user_prompt;
    const char* setup_pass_prompt;
    const char* setup_running;
    const char* setup_failed;
    const char* setup_skipped;

    // Install: start
    const char* enabling;
    const char* enabled;
    const char* install_complete;
    const char* now_running;
    const char* start_failed;

    // Uninstall
    const char* uninstall_title;
    const char* uninstall_warning;
    const char* uninstall_confirm;
    const char* uninstall_cancelled;
    const char* uninstall_stopping;
    const char* service_stopped;
    const char* service_disabled;
    const char* service_not_found;
    const char* killing_processes;
    const char* removing_unit;
    const char* daemon_reloaded;
    const char* removing_executable;
    const char* removing_working_dir;
    const char* searching_legacy;
    const char* removing_legacy;
    const char* cleaning_temp;
    const char* remove_failed;
    const char* uninstall_complete;
    const char* uninstall_manual_hint;

    // Service management
    const char* not_installed_error;
    const char* restarting;
    const char* restarted;
    const char* stopping;
    const char* showing_status;
    const char* showing_logs;

    // Errors
    const char* command_failed;
    const char* invalid_service_name;
    const char* root_required;
};

#include "i18n/en.hpp"
#include "i18n/zh.hpp"

inline const Strings EN_STRINGS = EN_STRINGS_DEF;
inline const Strings ZH_STRINGS = ZH_STRINGS_DEF;
inline std::atomic<Lang> current_lang{Lang::EN};

inline const Strings& T() {
    return current_lang.load() == Lang::ZH ? ZH_STRINGS : EN_STRINGS;
}
