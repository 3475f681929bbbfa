#include "core/command_runner.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

static std::vector<char*> make_argv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        out.push_back(const_cast<char*>(arg.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

static int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return decode_status(status);
}

std::string CommandRunner::describe(const std::vector<std::string>& argv) {
    static const std::string secret_flag = "--setup-pass=";
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        if (argv[i].compare(0, secret_flag.size(), secret_flag) == 0) {
            oss << secret_flag << "****";
        } else {
            oss << argv[i];
        }
    }
    return oss.str();
}

CommandResult SystemCommandRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) return result;

    spdlog::debug("exec: {}", describe(argv));

    auto args = make_argv(argv);
    int fds[2];
    if (pipe(fds) != 0) {
        spdlog::error("pipe() failed: {}", std::strerror(errno));
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("fork() failed: {}", std::strerror(errno));
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0) {
        // Child: stdout and stderr into the pipe, no stdin
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    close(fds[1]);
    char buffer[4096];
    ssize_t n;
    while ((n = read(fds[0], buffer, sizeof(buffer))) != 0) {
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        result.output.append(buffer, static_cast<size_t>(n));
    }
    close(fds[0]);

    result.exit_code = wait_child(pid);
    while (!result.output.empty() &&
           (result.output.back() == '\n' || result.output.back() == '\r')) {
        result.output.pop_back();
    }

    spdlog::debug("exit {}: {}", result.exit_code, argv[0]);
    return result;
}

int SystemCommandRunner::run_interactive(const std::vector<std::string>& argv) {
    if (argv.empty()) return -1;

    spdlog::debug("exec (attached): {}", describe(argv));

    auto args = make_argv(argv);

    // Same contract as system(): the child owns Ctrl+C while it runs
    struct sigaction ignore{}, old_int{}, old_quit{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &old_int);
    sigaction(SIGQUIT, &ignore, &old_quit);

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("fork() failed: {}", std::strerror(errno));
        sigaction(SIGINT, &old_int, nullptr);
        sigaction(SIGQUIT, &old_quit, nullptr);
        return -1;
    }

    if (pid == 0) {
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);
        execvp(args[0], args.data());
        _exit(127);
    }

    int code = wait_child(pid);
    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGQUIT, &old_quit, nullptr);

    spdlog::debug("exit {}: {}", code, argv[0]);
    return code;
}

bool SystemCommandRunner::has_command(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    std::istringstream stream(path);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}
