#pragma once

#include "gauntlet/cancel.h"
#include "gauntlet/sandbox_manager.h"
#include "gauntlet/types.h"

#include <optional>
#include <string>

namespace gauntlet {

struct VerificationOutcome {
    bool passed{false};
    double reward{0.0};
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{-1};
    std::optional<std::string> error;  // stderr when not passed
};

// Runs a task's test script in its sandbox. Exit code 0 is the only pass
// signal; no retries.
class Verifier {
public:
    explicit Verifier(SandboxManager& sandboxes, int timeout_sec = 60)
        : sandboxes_(sandboxes), timeout_sec_(timeout_sec > 0 ? timeout_sec : 60) {}

    // reward = task.expected_reward when passed, else 0.0
    VerificationOutcome verify(const std::string& handle,
                               const Task& task,
                               const CancelToken* cancel = nullptr);

    // Arbitrary script, same semantics, reward left at 0.0.
    VerificationOutcome run_custom(const std::string& handle,
                                   const std::string& script,
                                   const std::string& workdir = "/workspace",
                                   const CancelToken* cancel = nullptr);

    int timeout_sec() const { return timeout_sec_; }

private:
    VerificationOutcome run_script(const std::string& handle,
                                   const std::string& script,
                                   const std::string& workdir,
                                   const CancelToken* cancel);

    SandboxManager& sandboxes_;
    int timeout_sec_;
};

} // namespace gauntlet
