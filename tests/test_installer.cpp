#include <gtest/gtest.h>
#include "core/installer.hpp"
#include "core/temp_dir.hpp"
#include "ui/console.hpp"
#include "ui/prompt.hpp"
#include "i18n/i18n.hpp"
#include "fakes.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

// ── Sandbox ─────────────────────────────────────────────────
// Every absolute path of the config is moved under a private temp root.

class InstallerTest : public ::testing::Test {
protected:
    ScopedTempDir root{"", "phantom-installer-test-"};
    ManagerConfig cfg;
    FakeCommandRunner runner;
    FakeReleaseSource releases;
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    std::unique_ptr<Prompter> prompter;
    std::unique_ptr<Console> console;
    std::unique_ptr<Installer> installer;

    void SetUp() override {
        current_lang = Lang::EN;
        ASSERT_TRUE(root.valid());
        cfg = ManagerConfig().rebased(root.path());
        cfg.start_grace_seconds = 0;
    }

    Installer& make(const std::string& input, const std::string& machine = "x86_64") {
        in.str(input);
        in.clear();
        prompter = std::make_unique<Prompter>(in, out);
        console = std::make_unique<Console>(out, err, false);
        installer = std::make_unique<Installer>(cfg, runner, releases, *prompter, *console);
        installer->set_machine(machine);
        return *installer;
    }

    static void touch(const std::string& path, const std::string& content = "x") {
        fs::create_directories(fs::path(path).parent_path());
        std::ofstream f(path);
        f << content;
    }

    static std::string slurp(const std::string& path) {
        std::ifstream f(path);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    std::string active_cmd() const { return "systemctl is-active --quiet " + cfg.service_name; }
};

// ── Static helpers ──────────────────────────────────────────

TEST(InstallerHelpers, PortMustBeDigits) {
    EXPECT_TRUE(Installer::is_valid_port("8080"));
    EXPECT_TRUE(Installer::is_valid_port("0"));
    EXPECT_TRUE(Installer::is_valid_port("99999"));  // range is not checked
    EXPECT_FALSE(Installer::is_valid_port(""));
    EXPECT_FALSE(Installer::is_valid_port("80a"));
    EXPECT_FALSE(Installer::is_valid_port(" 80"));
    EXPECT_FALSE(Installer::is_valid_port("-1"));
}

TEST(InstallerHelpers, SetupCommandFlags) {
    SetupAnswers answers{"8080", "root", "s3cret"};
    auto argv = Installer::setup_command("/usr/local/bin/phantom", answers);
    ASSERT_EQ(argv.size(), 4u);
    EXPECT_EQ(argv[0], "/usr/local/bin/phantom");
    EXPECT_EQ(argv[1], "--setup-port=8080");
    EXPECT_EQ(argv[2], "--setup-user=root");
    EXPECT_EQ(argv[3], "--setup-pass=s3cret");
}

TEST(InstallerHelpers, DetectMachineNotEmpty) {
    EXPECT_FALSE(Installer::detect_machine().empty());
}

// ── Install: aborts ─────────────────────────────────────────

TEST_F(InstallerTest, UnsupportedArchitectureTouchesNothing) {
    auto& inst = make("", "mips64");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("mips64"), std::string::npos);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_EQ(releases.latest_tag_calls, 0);
    EXPECT_TRUE(releases.downloaded_urls.empty());
    EXPECT_TRUE(fs::is_empty(root.path()));
    EXPECT_NE(err.str().find("[ERROR] Unsupported architecture: mips64"), std::string::npos);
}

TEST_F(InstallerTest, EmptyTagSkipsDownload) {
    releases.tag = "";
    auto& inst = make("");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, T().tag_failed);
    EXPECT_EQ(releases.latest_tag_calls, 1);
    EXPECT_TRUE(releases.downloaded_urls.empty());
    EXPECT_FALSE(fs::exists(cfg.primary_path()));
}

TEST_F(InstallerTest, DownloadFailureLeavesNoFiles) {
    releases.download_ok = false;
    auto& inst = make("");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, T().download_failed);
    EXPECT_FALSE(fs::exists(cfg.install_dir));
    EXPECT_FALSE(fs::exists(cfg.working_dir));
    EXPECT_FALSE(fs::exists(cfg.unit_path()));
    // The scratch directory is gone again
    ASSERT_TRUE(fs::exists(cfg.temp_root));
    EXPECT_TRUE(fs::is_empty(cfg.temp_root));
    EXPECT_FALSE(runner.ran("systemctl stop " + cfg.service_name));
}

TEST_F(InstallerTest, MissingToolsWithoutPackageManagerAbort) {
    runner.commands = {"systemctl", "curl"};  // no apt-get, no yum, no grep
    auto& inst = make("");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("grep"), std::string::npos);
    EXPECT_EQ(releases.latest_tag_calls, 0);
}

TEST_F(InstallerTest, ToolsOnPathWithoutPackageManagerProceed) {
    runner.commands = {"systemctl", "curl", "grep"};
    releases.tag = "";  // stop right after the dependency step
    auto& inst = make("");
    inst.install_or_update();

    EXPECT_EQ(releases.latest_tag_calls, 1);
    EXPECT_NE(out.str().find("[WARN] Unsupported package manager"), std::string::npos);
}

TEST_F(InstallerTest, PackageManagerFailureAborts) {
    runner.script("apt-get update -y", 100, "E: could not resolve");
    auto& inst = make("");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("apt-get"), std::string::npos);
    EXPECT_NE(result.message.find("could not resolve"), std::string::npos);
    EXPECT_EQ(releases.latest_tag_calls, 0);
}

// ── Install: fresh host ─────────────────────────────────────

TEST_F(InstallerTest, FreshInstallPlacesEverything) {
    runner.script_sequence(active_cmd(), {3, 0});  // stopped before, running after
    auto& inst = make("8080\n\n\n");
    auto result = inst.install_or_update();

    EXPECT_TRUE(result.success) << result.message;

    ASSERT_TRUE(fs::is_regular_file(cfg.primary_path()));
    EXPECT_EQ(slurp(cfg.primary_path()), releases.payload);
    auto perms = fs::status(cfg.primary_path()).permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);

    ASSERT_TRUE(fs::is_symlink(cfg.alias_path()));
    EXPECT_EQ(fs::read_symlink(cfg.alias_path()).string(), cfg.primary_path());

    EXPECT_TRUE(fs::is_directory(cfg.working_dir));
    EXPECT_EQ(slurp(cfg.unit_path()), ServiceManager::generate_unit_content(cfg));

    ASSERT_EQ(releases.downloaded_urls.size(), 1u);
    EXPECT_EQ(releases.downloaded_urls[0],
              "https://github.com/0fariid0/Phantom-Tunnel/releases/download/v1.2.3/phantom-amd64");

    EXPECT_TRUE(runner.ran("apt-get update -y"));
    EXPECT_TRUE(runner.ran("apt-get install -y -qq curl grep"));
    EXPECT_TRUE(runner.ran("systemctl daemon-reload"));
    EXPECT_TRUE(runner.ran("systemctl enable --now phantom.service"));
    EXPECT_FALSE(runner.ran("systemctl stop phantom.service"));

    ASSERT_EQ(runner.interactive_calls.size(), 1u);
    EXPECT_EQ(runner.interactive_calls[0],
              Installer::setup_command(cfg.primary_path(), SetupAnswers{"8080", "admin", "admin"}));

    EXPECT_TRUE(fs::is_empty(cfg.temp_root));
    EXPECT_NE(out.str().find("Phantom Tunnel is now RUNNING!"), std::string::npos);
}

TEST_F(InstallerTest, SetupUsesTypedCredentials) {
    runner.script_sequence(active_cmd(), {3, 0});
    auto& inst = make("2053\noperator\nhunter2\n");
    auto result = inst.install_or_update();

    EXPECT_TRUE(result.success) << result.message;
    ASSERT_EQ(runner.interactive_calls.size(), 1u);
    EXPECT_EQ(runner.interactive_calls[0],
              Installer::setup_command(cfg.primary_path(), SetupAnswers{"2053", "operator", "hunter2"}));
}

TEST_F(InstallerTest, Arm64AssetSelected) {
    runner.script_sequence(active_cmd(), {3, 0});
    auto& inst = make("8080\n\n\n", "aarch64");
    inst.install_or_update();

    ASSERT_EQ(releases.downloaded_urls.size(), 1u);
    EXPECT_NE(releases.downloaded_urls[0].find("/v1.2.3/phantom-arm64"), std::string::npos);
}

TEST_F(InstallerTest, InvalidPortAbortsBeforeEnable) {
    runner.script(active_cmd(), 3);
    auto& inst = make("80a\n");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, T().setup_port_invalid);
    EXPECT_TRUE(runner.interactive_calls.empty());
    EXPECT_FALSE(runner.ran("systemctl enable --now phantom.service"));
}

TEST_F(InstallerTest, EmptyPortAborts) {
    runner.script(active_cmd(), 3);
    auto& inst = make("\n");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(runner.interactive_calls.empty());
}

TEST_F(InstallerTest, SetupFailureAbortsBeforeEnable) {
    runner.script(active_cmd(), 3);
    runner.script_interactive(
        FakeCommandRunner::key(Installer::setup_command(cfg.primary_path(), {"8080", "admin", "admin"})), 2);
    auto& inst = make("8080\n\n\n");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(runner.ran("systemctl enable --now phantom.service"));
}

TEST_F(InstallerTest, ServiceNotRunningAfterStartIsFailure) {
    runner.script(active_cmd(), 3);
    auto& inst = make("8080\n\n\n");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(runner.ran("systemctl enable --now phantom.service"));
    EXPECT_NE(err.str().find("journalctl -u phantom.service"), std::string::npos);
}

TEST_F(InstallerTest, EnableFailureIsReported) {
    runner.script(active_cmd(), 3);
    runner.script("systemctl enable --now phantom.service", 1, "Failed to enable unit");
    auto& inst = make("8080\n\n\n");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("Failed to enable unit"), std::string::npos);
}

// ── Install: update of an existing installation ─────────────

TEST_F(InstallerTest, UpdateStopsServiceAndSkipsSetup) {
    touch(cfg.primary_path(), "old binary");
    touch(cfg.database_path());
    runner.script(active_cmd(), 0);
    auto& inst = make("");
    auto result = inst.install_or_update();

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_TRUE(runner.ran("systemctl stop phantom.service"));
    EXPECT_TRUE(runner.interactive_calls.empty());
    EXPECT_EQ(out.str().find(T().setup_port_prompt), std::string::npos);
    EXPECT_EQ(slurp(cfg.primary_path()), releases.payload);
    EXPECT_TRUE(fs::exists(cfg.database_path()));
}

TEST_F(InstallerTest, StaleAliasIsReplaced) {
    touch(cfg.database_path());
    fs::create_directories(cfg.install_dir);
    fs::create_symlink(fs::path(root.path()) / "nowhere", cfg.alias_path());
    runner.script(active_cmd(), 0);
    auto& inst = make("");
    auto result = inst.install_or_update();

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(fs::read_symlink(cfg.alias_path()).string(), cfg.primary_path());
}

TEST_F(InstallerTest, StopFailureDuringUpdateAborts) {
    touch(cfg.database_path());
    runner.script(active_cmd(), 0);
    runner.script("systemctl stop phantom.service", 1);
    auto& inst = make("");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(fs::exists(cfg.primary_path()));
}

// ── Service management ──────────────────────────────────────

TEST_F(InstallerTest, ServiceOperationsRequireInstallation) {
    auto& inst = make("");

    EXPECT_FALSE(inst.restart_service().success);
    EXPECT_FALSE(inst.stop_service().success);
    EXPECT_FALSE(inst.show_status().success);
    EXPECT_FALSE(inst.view_logs().success);

    EXPECT_TRUE(runner.calls.empty());
    EXPECT_TRUE(runner.interactive_calls.empty());
    EXPECT_NE(err.str().find(T().not_installed_error), std::string::npos);
}

TEST_F(InstallerTest, RestartAndStop) {
    touch(cfg.primary_path());
    auto& inst = make("");

    EXPECT_TRUE(inst.restart_service().success);
    EXPECT_TRUE(runner.ran("systemctl restart phantom.service"));

    EXPECT_TRUE(inst.stop_service().success);
    EXPECT_TRUE(runner.ran("systemctl stop phantom.service"));
}

TEST_F(InstallerTest, RestartFailureIsReported) {
    touch(cfg.primary_path());
    runner.script("systemctl restart phantom.service", 5, "Unit phantom.service not found.");
    auto& inst = make("");

    auto result = inst.restart_service();
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("not found"), std::string::npos);
}

TEST_F(InstallerTest, StatusOfStoppedServiceIsNotAnError) {
    touch(cfg.primary_path());
    runner.script_interactive("systemctl status phantom.service", 3);
    auto& inst = make("");

    EXPECT_TRUE(inst.show_status().success);
    ASSERT_EQ(runner.interactive_calls.size(), 1u);
    EXPECT_EQ(FakeCommandRunner::key(runner.interactive_calls[0]), "systemctl status phantom.service");
}

TEST_F(InstallerTest, LogsFollowJournal) {
    touch(cfg.primary_path());
    runner.script_interactive("journalctl -u phantom.service -f", 130);  // Ctrl+C
    auto& inst = make("");

    EXPECT_TRUE(inst.view_logs().success);
    ASSERT_EQ(runner.interactive_calls.size(), 1u);
    EXPECT_EQ(FakeCommandRunner::key(runner.interactive_calls[0]), "journalctl -u phantom.service -f");
}

TEST_F(InstallerTest, MissingJournalctlIsAnError) {
    touch(cfg.primary_path());
    runner.script_interactive("journalctl -u phantom.service -f", 127);
    auto& inst = make("");

    EXPECT_FALSE(inst.view_logs().success);
}

TEST_F(InstallerTest, InstalledStateFollowsFiles) {
    auto& inst = make("");
    EXPECT_FALSE(inst.is_installed());
    EXPECT_FALSE(inst.has_database());

    touch(cfg.primary_path());
    touch(cfg.database_path());
    EXPECT_TRUE(inst.is_installed());
    EXPECT_TRUE(inst.has_database());
}

TEST_F(InstallerTest, UnitNameOutsideUnitDirWritesNothing) {
    cfg.service_name = "../../victim.conf";
    const std::string victim = (fs::path(cfg.unit_dir) / cfg.service_name).lexically_normal().string();
    touch(victim, "precious");
    auto& inst = make("8080\n\n\n");
    auto result = inst.install_or_update();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(slurp(victim), "precious");
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_EQ(releases.latest_tag_calls, 0);
    EXPECT_FALSE(fs::exists(cfg.primary_path()));
    EXPECT_NE(err.str().find("Invalid service name: ../../victim.conf"), std::string::npos);
}

TEST_F(InstallerTest, UnitNameIsCheckedBeforeServiceCommands) {
    cfg.service_name = "phantom;reboot";
    touch(cfg.primary_path());
    auto& inst = make("");

    EXPECT_FALSE(inst.restart_service().success);
    EXPECT_FALSE(inst.show_status().success);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_TRUE(runner.interactive_calls.empty());
}
