#include "gauntlet/verifier.h"

namespace gauntlet {

VerificationOutcome Verifier::run_script(const std::string& handle,
                                         const std::string& script,
                                         const std::string& workdir,
                                         const CancelToken* cancel) {
    CommandRequest req;
    req.command = script;
    req.timeout_sec = timeout_sec_;
    if (!workdir.empty()) req.workdir = workdir;

    CommandResult r = sandboxes_.exec(handle, req, cancel);

    VerificationOutcome out;
    out.stdout_text = r.stdout_text;
    out.stderr_text = r.stderr_text;
    out.exit_code = r.exit_code;
    out.passed = r.exit_code == 0;
    if (!out.passed) out.error = r.stderr_text;
    return out;
}

VerificationOutcome Verifier::verify(const std::string& handle,
                                     const Task& task,
                                     const CancelToken* cancel) {
    VerificationOutcome out = run_script(handle, task.test_script, task.working_directory, cancel);
    out.reward = out.passed ? task.expected_reward : 0.0;
    return out;
}

VerificationOutcome Verifier::run_custom(const std::string& handle,
                                         const std::string& script,
                                         const std::string& workdir,
                                         const CancelToken* cancel) {
    return run_script(handle, script, workdir, cancel);
}

} // namespace gauntlet
