#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace pkgstage {

// ============================================================================
// External Tool Execution
// ============================================================================

struct ProcessSpec {
    std::vector<std::string> argv;                          // argv[0] searched in PATH
    std::string cwd;                                        // empty: inherit
    std::unordered_map<std::string, std::string> env;       // added to the inherited environment
    int timeout_seconds = 0;                                // 0: wait forever
};

struct ProcessResult {
    bool ok = false;          // process was spawned and reaped
    int exit_code = -1;       // 128+N when killed by signal N, 124 on timeout
    bool timed_out = false;
    std::string error;        // spawn/wait failure, or exec failure in the child
};

constexpr int TIMEOUT_EXIT_CODE = 124;

/**
 * Run a child process and block until it exits.
 *
 * stdout and stderr are inherited, so tool output reaches the user verbatim.
 * With a timeout the child runs in its own process group; on expiry the
 * group receives SIGTERM and, after a short grace period, SIGKILL.
 */
ProcessResult run_process(const ProcessSpec& spec);

// Render argv for logs, quoting arguments that contain shell metacharacters
std::string format_command(const std::vector<std::string>& argv);

} // namespace pkgstage
