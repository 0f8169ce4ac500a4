#pragma once

#include <atomic>
#include <string>
#include <vector>

namespace gauntlet {

struct ProcLimits {
    int timeout_ms{30000};
    size_t stdout_max_bytes{256 * 1024};
    size_t stderr_max_bytes{64 * 1024};

    // Merge stderr into `output` instead of capturing it separately.
    bool merge_stderr{false};

    bool no_new_privs{true};

    // When set and raised, the child's process group is killed and the call
    // returns with cancelled=true.
    const std::atomic<bool>* cancel_flag{nullptr};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    std::string output;     // child stdout (stdout+stderr when merged)
    std::string err_output; // child stderr when not merged
    std::string error;      // internal runner error, not child stderr
};

// Run a process (argv[0] is executable, PATH lookup), capture stdout and
// stderr, enforce the timeout and the cancel flag by killing the child's
// process group. Returns true if the process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// Same, feeding stdin_data to the child. Writes are interleaved with reads
// so large payloads cannot deadlock. Callers should ignore SIGPIPE.
bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace gauntlet
