#pragma once
#include <atomic>

namespace gauntlet {

// Cooperative stop signal shared by the run loop, sandbox execs and
// messenger round trips. Child processes are polled against it.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    void reset() { flag_.store(false); }
    bool cancelled() const { return flag_.load(); }

    // For code that only needs the raw flag (ProcLimits::cancel_flag).
    const std::atomic<bool>* flag() const { return &flag_; }

private:
    std::atomic<bool> flag_{false};
};

} // namespace gauntlet
