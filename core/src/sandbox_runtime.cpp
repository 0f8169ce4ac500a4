#include "gauntlet/sandbox_runtime.h"

#include "gauntlet/diag.h"
#include "gauntlet/proc.h"

#include <algorithm>
#include <atomic>
#include <cstdint>

#ifndef _WIN32
  #include <unistd.h>
#endif

namespace gauntlet {

namespace {

constexpr int kControlTimeoutMs = 60 * 1000;
constexpr int kPullTimeoutMs = 15 * 60 * 1000;
constexpr int kKillTimeoutMs = 10 * 1000;

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t'))
        s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n')) i++;
    return s.substr(i);
}

bool looks_missing(const std::string& err) {
    return err.find("No such container") != std::string::npos ||
           err.find("No such object") != std::string::npos ||
           err.find("not found") != std::string::npos;
}

// The docker client itself failed (daemon error, container gone) rather than
// the command it was asked to run. Exit 125 is reserved for the client;
// daemon errors on other codes are recognized by their message prefix.
bool client_failed(const ProcResult& pr) {
    if (pr.exit_code == 125) return true;
    if (pr.exit_code == 0) return false;
    const std::string err = trim(pr.err_output);
    return err.rfind("Error response from daemon:", 0) == 0 ||
           err.rfind("Error: No such container", 0) == 0;
}

// Outcome of one docker CLI call as a RuntimeStatus.
RuntimeStatus status_of(const char* what, bool started, const ProcResult& pr) {
    if (!started) return RuntimeStatus::failure(std::string(what) + ": " + pr.error);
    if (pr.cancelled) return RuntimeStatus::failure(std::string(what) + ": cancelled");
    if (pr.timed_out) return RuntimeStatus::failure(std::string(what) + ": timed out");
    if (pr.exit_code != 0) {
        std::string msg = trim(pr.err_output);
        if (msg.empty()) msg = trim(pr.output);
        if (msg.empty()) msg = "exit code " + std::to_string(pr.exit_code);
        return RuntimeStatus::failure(std::string(what) + ": " + msg, looks_missing(msg));
    }
    return RuntimeStatus::success();
}

std::string next_exec_token() {
    static std::atomic<uint64_t> seq{0};
#ifndef _WIN32
    long pid = (long)getpid();
#else
    long pid = 0;
#endif
    return std::to_string(pid) + "_" + std::to_string(++seq);
}

// Runs the command under a parent shell whose pid lands in the pid file,
// so a second exec can find and kill the whole tree.
std::string exec_wrapper(const std::string& pid_file) {
    return "echo $$ > " + pid_file + "; /bin/sh -c \"$1\"; rc=$?; rm -f " + pid_file + "; exit $rc";
}

std::string kill_script(const std::string& pid_file) {
    return "p=$(cat " + pid_file + " 2>/dev/null); "
           "if [ -n \"$p\" ]; then "
           "kt() { for c in $(cat /proc/$1/task/*/children 2>/dev/null); do kt \"$c\"; done; kill -9 \"$1\" 2>/dev/null; }; "
           "kt \"$p\"; kill -9 -\"$p\" 2>/dev/null; "
           "fi; rm -f " + pid_file + "; true";
}

} // namespace

DockerCliRuntime::DockerCliRuntime(const std::string& docker_bin) {
    docker_ = split_argv_quoted(docker_bin);
    if (docker_.empty()) {
        log_warn("sandbox", "unparsable docker binary '" + docker_bin + "', using 'docker'");
        docker_.push_back("docker");
    }
}

std::vector<std::string> DockerCliRuntime::base_argv() const {
    return docker_;
}

bool DockerCliRuntime::image_present(const std::string& image) {
    auto argv = base_argv();
    argv.insert(argv.end(), {"image", "inspect", "--format", "{{.Id}}", image});
    ProcLimits lim;
    lim.timeout_ms = kControlTimeoutMs;
    ProcResult pr;
    bool started = proc_run_capture(argv, "", lim, &pr);
    return started && !pr.timed_out && pr.exit_code == 0;
}

RuntimeStatus DockerCliRuntime::pull_image(const std::string& image, const CancelToken* cancel) {
    auto argv = base_argv();
    argv.insert(argv.end(), {"pull", "--quiet", image});
    ProcLimits lim;
    lim.timeout_ms = kPullTimeoutMs;
    lim.cancel_flag = cancel ? cancel->flag() : nullptr;
    ProcResult pr;
    bool started = proc_run_capture(argv, "", lim, &pr);
    return status_of("docker pull", started, pr);
}

std::vector<std::string> DockerCliRuntime::create_argv(const SandboxSpec& spec) const {
    auto argv = base_argv();
    argv.push_back("create");
    if (!spec.name.empty()) {
        argv.push_back("--name");
        argv.push_back(spec.name);
    }
    if (spec.limits.network_isolated) {
        argv.push_back("--network");
        argv.push_back("none");
    }
    const std::string mem = std::to_string(spec.limits.memory_mb) + "m";
    argv.insert(argv.end(), {"--memory", mem, "--memory-swap", mem});
    // CPU ceiling as a CFS quota: cpu_percent of one period
    argv.insert(argv.end(), {"--cpu-period", "100000",
                             "--cpu-quota", std::to_string(spec.limits.cpu_percent * 1000)});
    argv.push_back("-w");
    argv.push_back(spec.working_directory);
    for (const auto& kv : spec.environment) {
        argv.push_back("-e");
        argv.push_back(kv.first + "=" + kv.second);
    }
    for (const auto& kv : spec.labels) {
        argv.push_back("--label");
        argv.push_back(kv.first + "=" + kv.second);
    }
    argv.push_back(spec.image);
    argv.insert(argv.end(), {"sleep", "infinity"});
    return argv;
}

RuntimeStatus DockerCliRuntime::create_environment(const SandboxSpec& spec, std::string* env_id) {
    ProcLimits lim;
    lim.timeout_ms = kControlTimeoutMs;
    ProcResult pr;
    bool started = proc_run_capture(create_argv(spec), "", lim, &pr);
    RuntimeStatus st = status_of("docker create", started, pr);
    if (!st.ok) return st;

    std::string id = trim(pr.output);
    if (id.empty()) return RuntimeStatus::failure("docker create: no container id in output");
    if (env_id) *env_id = id;
    return st;
}

RuntimeStatus DockerCliRuntime::start(const std::string& env_id) {
    auto argv = base_argv();
    argv.insert(argv.end(), {"start", env_id});
    ProcLimits lim;
    lim.timeout_ms = kControlTimeoutMs;
    ProcResult pr;
    bool started = proc_run_capture(argv, "", lim, &pr);
    return status_of("docker start", started, pr);
}

std::vector<std::string> DockerCliRuntime::exec_argv(const std::string& env_id,
                                                     const CommandRequest& req,
                                                     const std::string& pid_file) const {
    auto argv = base_argv();
    argv.push_back("exec");
    if (req.workdir && !req.workdir->empty()) {
        argv.push_back("-w");
        argv.push_back(*req.workdir);
    }
    argv.push_back(env_id);
    argv.insert(argv.end(), {"/bin/sh", "-c", exec_wrapper(pid_file), "sh", req.command});
    return argv;
}

void DockerCliRuntime::kill_in_sandbox(const std::string& env_id, const std::string& pid_file) {
    auto argv = base_argv();
    argv.insert(argv.end(), {"exec", env_id, "/bin/sh", "-c", kill_script(pid_file)});
    ProcLimits lim;
    lim.timeout_ms = kKillTimeoutMs;
    ProcResult pr;
    bool started = proc_run_capture(argv, "", lim, &pr);
    if (!started || pr.timed_out || pr.exit_code != 0) {
        log_warn("sandbox", "failed to kill timed-out command in " + env_id + ": " +
                 (started ? trim(pr.err_output) : pr.error));
    }
}

CommandResult DockerCliRuntime::exec(const std::string& env_id,
                                     const CommandRequest& req,
                                     const CancelToken* cancel) {
    const std::string pid_file = "/tmp/.gauntlet_exec_" + next_exec_token() + ".pid";
    const int timeout_sec = std::max(1, req.timeout_sec);

    ProcLimits lim;
    lim.timeout_ms = timeout_sec * 1000;
    lim.cancel_flag = cancel ? cancel->flag() : nullptr;
    ProcResult pr;
    bool started = proc_run_capture(exec_argv(env_id, req, pid_file), "", lim, &pr);

    CommandResult r;
    if (!started) {
        r.exit_code = -1;
        r.stderr_text = "exec failed: " + pr.error;
        return r;
    }

    r.stdout_text = pr.output;
    if (pr.timed_out || pr.cancelled) {
        // the docker client is gone but the command still runs in the sandbox
        kill_in_sandbox(env_id, pid_file);
        r.exit_code = -1;
        r.timed_out = pr.timed_out;
        r.stderr_text = pr.timed_out
            ? "Command timed out after " + std::to_string(timeout_sec) + "s"
            : std::string("Command cancelled");
        return r;
    }

    r.stderr_text = pr.err_output;
    r.exit_code = pr.exit_code;
    if (client_failed(pr)) {
        log_warn("sandbox", "docker exec in " + env_id + " failed: " + trim(pr.err_output));
        r.exit_code = -1;
    }
    if (pr.output_truncated) log_debug("sandbox", "command output truncated in " + env_id);
    return r;
}

RuntimeStatus DockerCliRuntime::stop(const std::string& env_id, int grace_sec) {
    auto argv = base_argv();
    argv.insert(argv.end(), {"stop", "-t", std::to_string(std::max(0, grace_sec)), env_id});
    ProcLimits lim;
    lim.timeout_ms = (std::max(0, grace_sec) + 30) * 1000;
    ProcResult pr;
    bool started = proc_run_capture(argv, "", lim, &pr);
    return status_of("docker stop", started, pr);
}

RuntimeStatus DockerCliRuntime::remove(const std::string& env_id, bool force) {
    auto argv = base_argv();
    argv.push_back("rm");
    if (force) argv.push_back("-f");
    argv.push_back(env_id);
    ProcLimits lim;
    lim.timeout_ms = kControlTimeoutMs;
    ProcResult pr;
    bool started = proc_run_capture(argv, "", lim, &pr);
    return status_of("docker rm", started, pr);
}

} // namespace gauntlet
