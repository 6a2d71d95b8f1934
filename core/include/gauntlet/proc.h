#pragma once

#include <string>
#include <utility>
#include <vector>

namespace gauntlet {

struct ProcLimits {
    int timeout_ms{5000};
    size_t stdout_max_bytes{16 * 1024 * 1024};
    size_t stderr_max_bytes{1024 * 1024};

    // 0 disables the corresponding rlimit.
    int rlimit_cpu_sec{0};          // CPU time seconds
    size_t rlimit_as_mb{0};         // virtual memory MB
    size_t rlimit_fsize_mb{0};      // max file size MB
    int rlimit_nofile{0};           // max open fds
    int rlimit_nproc{0};            // max processes (best-effort)

    bool no_new_privs{true};
};

// KEY=VALUE pairs set in the child only.
using EnvOverlay = std::vector<std::pair<std::string, std::string>>;

struct ProcResult {
    int exit_code{127};
    bool launched{false};
    bool timed_out{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    int elapsed_ms{0};
    std::string out;    // child stdout
    std::string err;    // child stderr
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is executable, PATH lookup applies), feed stdin_data
// to its stdin, capture stdout and stderr separately. Enforces the timeout by
// killing the child's process group. Returns false if the process could not
// be started (res->error says why); a non-zero exit still returns true.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const EnvOverlay& env,
                      const ProcLimits& lim,
                      ProcResult* res);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace gauntlet
