#include "ocx/exec.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace ocx {

#ifndef _WIN32

namespace {

// Parent ignores terminal interrupts while the child runs, as system(3) does
class InterruptGuard {
public:
    InterruptGuard() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &saved_int_);
        sigaction(SIGQUIT, &ignore, &saved_quit_);
    }

    ~InterruptGuard() { restore(); }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    // Also called in the child before exec; handlers become SIG_DFL across exec
    void restore() const {
        sigaction(SIGINT, &saved_int_, nullptr);
        sigaction(SIGQUIT, &saved_quit_, nullptr);
    }

private:
    struct sigaction saved_int_ {};
    struct sigaction saved_quit_ {};
};

} // namespace

ExecResult run_process(const std::vector<std::string>& argv_strings,
                       const std::string& cwd,
                       const std::map<std::string, std::string>& env_overrides) {
    ExecResult result;

    if (argv_strings.empty()) {
        result.error = "no command given";
        return result;
    }

    // Build C-style arrays before forking
    std::vector<char*> argv;
    for (const auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    spdlog::debug("running {} in {}", argv_strings[0], cwd);

    InterruptGuard interrupts;
    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        interrupts.restore();

        for (const auto& [key, value] : env_overrides) {
            if (setenv(key.c_str(), value.c_str(), 1) != 0) {
                _exit(127);
            }
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) continue;
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

#else

ExecResult run_process(const std::vector<std::string>& argv_strings,
                       const std::string&,
                       const std::map<std::string, std::string>&) {
    ExecResult result;
    result.error = "running commands in an overlay is not supported on Windows: " +
                   (argv_strings.empty() ? std::string() : argv_strings[0]);
    return result;
}

#endif

} // namespace ocx
