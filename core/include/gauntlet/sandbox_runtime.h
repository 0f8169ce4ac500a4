#pragma once

// Gauntlet sandbox runtime: the isolation technology behind SandboxManager.
//
// ISandboxRuntime is the narrow seam the manager drives: image presence,
// environment create/start, exec with a hard timeout, stop, remove.
// DockerCliRuntime implements it by running the docker CLI as a child
// process (proc_run_capture), so no daemon client library is linked.

#include "gauntlet/cancel.h"
#include "gauntlet/config.h"
#include "gauntlet/types.h"

#include <map>
#include <string>
#include <vector>

namespace gauntlet {

struct RuntimeStatus {
    bool ok{true};
    bool not_found{false};  // the runtime no longer knows the environment
    std::string error;

    static RuntimeStatus success() { return RuntimeStatus{}; }
    static RuntimeStatus failure(std::string msg, bool missing = false) {
        RuntimeStatus s;
        s.ok = false;
        s.not_found = missing;
        s.error = std::move(msg);
        return s;
    }
};

// Everything needed to provision one environment.
struct SandboxSpec {
    std::string name;   // runtime-side name, unique per sandbox
    std::string image;
    std::string working_directory{"/workspace"};
    std::map<std::string, std::string> environment;
    std::map<std::string, std::string> labels;
    SandboxLimits limits;
};

class ISandboxRuntime {
public:
    virtual ~ISandboxRuntime() = default;

    virtual bool image_present(const std::string& image) = 0;
    virtual RuntimeStatus pull_image(const std::string& image, const CancelToken* cancel) = 0;

    // On success *env_id holds the runtime's id for the environment.
    virtual RuntimeStatus create_environment(const SandboxSpec& spec, std::string* env_id) = 0;
    virtual RuntimeStatus start(const std::string& env_id) = 0;

    // Must return by req.timeout_sec. On timeout or cancellation the process
    // started inside the environment is killed before returning.
    virtual CommandResult exec(const std::string& env_id,
                               const CommandRequest& req,
                               const CancelToken* cancel) = 0;

    virtual RuntimeStatus stop(const std::string& env_id, int grace_sec) = 0;
    virtual RuntimeStatus remove(const std::string& env_id, bool force) = 0;
};

class DockerCliRuntime : public ISandboxRuntime {
public:
    // docker_bin may carry a prefix, e.g. "sudo docker" or "podman".
    explicit DockerCliRuntime(const std::string& docker_bin = "docker");

    bool image_present(const std::string& image) override;
    RuntimeStatus pull_image(const std::string& image, const CancelToken* cancel) override;
    RuntimeStatus create_environment(const SandboxSpec& spec, std::string* env_id) override;
    RuntimeStatus start(const std::string& env_id) override;
    CommandResult exec(const std::string& env_id,
                       const CommandRequest& req,
                       const CancelToken* cancel) override;
    RuntimeStatus stop(const std::string& env_id, int grace_sec) override;
    RuntimeStatus remove(const std::string& env_id, bool force) override;

    // argv for `docker create`; exposed so tests can check the resource caps.
    std::vector<std::string> create_argv(const SandboxSpec& spec) const;

    // argv for `docker exec` of one command; the in-sandbox shell records
    // its pid in pid_file so a timed-out command can be killed.
    std::vector<std::string> exec_argv(const std::string& env_id,
                                       const CommandRequest& req,
                                       const std::string& pid_file) const;

private:
    std::vector<std::string> base_argv() const;
    void kill_in_sandbox(const std::string& env_id, const std::string& pid_file);

    std::vector<std::string> docker_;
};

} // namespace gauntlet
