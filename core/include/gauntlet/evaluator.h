#pragma once

// Gauntlet evaluator: the per-task state machine and the run over a task list.
//
// Per task: Created -> InstructionSent -> Looping -> Verifying -> Finalizing
// -> Terminated, or Errored from any non-terminal state. The sandbox is
// destroyed on every exit path and exactly one EvaluationResult comes out.
//
// A run resets the aggregator, loads the tasks, evaluates them (in source
// order, or on `workers` threads), records every result and destroys any
// sandbox still tracked. Loading and aggregation failures abort the run and
// leave the evaluator in RunStatus::ERROR; per-task failures never do.

#include "gauntlet/cancel.h"
#include "gauntlet/config.h"
#include "gauntlet/log.h"
#include "gauntlet/messenger.h"
#include "gauntlet/metrics.h"
#include "gauntlet/sandbox_manager.h"
#include "gauntlet/task_source.h"
#include "gauntlet/types.h"
#include "gauntlet/verifier.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>

namespace gauntlet {

enum class RunStatus { IDLE, RUNNING, COMPLETED, CANCELLED, ERROR };

const char* run_status_name(RunStatus s);

class Evaluator {
public:
    Evaluator(EvalConfig cfg,
              ITaskSource& tasks,
              SandboxManager& sandboxes,
              IMessenger& messenger,
              MetricsAggregator& metrics,
              JsonlLogger* events = nullptr);

    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    // One task, start to finish. Never throws.
    EvaluationResult evaluate_task(const Task& task);

    // Whole dataset. Throws std::runtime_error on run-level failure or when a
    // run is already in progress. A cancel raised before the call stops the
    // run before any task starts; the token is cleared when run() returns.
    AggregateMetrics run();

    // Raise the cancellation token; an in-flight exec or messenger round trip
    // returns promptly and no further tasks are started.
    void cancel() { cancel_.cancel(); }
    CancelToken& cancel_token() { return cancel_; }

    RunStatus status() const;
    std::string last_error() const;
    std::string status_text() const;
    bool running() const { return running_.load(); }

    const EvalConfig& config() const { return cfg_; }

private:
    using Clock = std::chrono::steady_clock;

    EvaluationResult run_lifecycle(const Task& task,
                                   Clock::time_point start,
                                   std::string& handle,
                                   EvalState& state,
                                   int& turns);
    void run_tasks(const std::vector<Task>& tasks);
    void set_status(RunStatus s, const std::string& err = "");
    void emit(const std::string& name, const std::string& payload_json);

    EvalConfig cfg_;
    ITaskSource& tasks_;
    SandboxManager& sandboxes_;
    IMessenger& messenger_;
    MetricsAggregator& metrics_;
    JsonlLogger* events_;
    Verifier verifier_;

    CancelToken cancel_;
    std::atomic<bool> running_{false};
    std::atomic<int> step_{0};

    mutable std::mutex mu_;
    RunStatus status_{RunStatus::IDLE};
    std::string error_;
    std::set<std::string> in_flight_;
};

} // namespace gauntlet
