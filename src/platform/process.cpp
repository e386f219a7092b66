#include "pkgstage/process.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace pkgstage {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(20);
constexpr auto KILL_GRACE = std::chrono::seconds(2);

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Poll waitpid until the child exits or the deadline passes.
// Returns true when the child was reaped.
bool wait_until(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) return true;
        if (r == -1 && errno != EINTR) return false;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

[[noreturn]] void exec_child(const ProcessSpec& spec, std::vector<char*>& argv, int report_fd) {
    if (spec.timeout_seconds > 0) {
        setpgid(0, 0);
    }

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
        int err = errno;
        ssize_t n = write(report_fd, &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    for (const auto& [key, value] : spec.env) {
        setenv(key.c_str(), value.c_str(), 1);
    }

    execvp(argv[0], argv.data());

    // execvp only returns on failure
    int err = errno;
    ssize_t n = write(report_fd, &err, sizeof(err));
    (void)n;
    _exit(127);
}

} // namespace

ProcessResult run_process(const ProcessSpec& spec) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<std::string> argv_strings = spec.argv;
    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    // The child reports exec/chdir failures through a close-on-exec pipe
    int report[2];
    if (pipe2(report, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(report[0]);
        close(report[1]);
        return result;
    }

    if (pid == 0) {
        close(report[0]);
        exec_child(spec, argv, report[1]);
    }

    if (spec.timeout_seconds > 0) {
        setpgid(pid, pid);
    }

    close(report[1]);
    int child_errno = 0;
    ssize_t got;
    do {
        got = read(report[0], &child_errno, sizeof(child_errno));
    } while (got == -1 && errno == EINTR);
    close(report[0]);

    int status = 0;
    if (spec.timeout_seconds <= 0) {
        pid_t r;
        do {
            r = waitpid(pid, &status, 0);
        } while (r == -1 && errno == EINTR);
        if (r == -1) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    } else {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(spec.timeout_seconds);
        if (!wait_until(pid, deadline, status)) {
            kill(-pid, SIGTERM);
            if (!wait_until(pid, std::chrono::steady_clock::now() + KILL_GRACE, status)) {
                kill(-pid, SIGKILL);
                waitpid(pid, &status, 0);
            }
            result.ok = true;
            result.timed_out = true;
            result.exit_code = TIMEOUT_EXIT_CODE;
            result.error = "timed out after " + std::to_string(spec.timeout_seconds) + "s";
            return result;
        }
    }

    result.ok = true;
    result.exit_code = decode_status(status);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        result.error = "cannot execute " + spec.argv[0] + ": " + strerror(child_errno);
    }

    return result;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        bool needs_quotes = arg.empty() ||
            arg.find_first_of(" \t\n'\"\\$`|&;<>()*?[]{}!#~") != std::string::npos;
        if (!needs_quotes) {
            out += arg;
            continue;
        }
        out += '\'';
        for (char c : arg) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += '\'';
    }
    return out;
}

} // namespace pkgstage
