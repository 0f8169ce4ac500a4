#include "gauntlet/evaluator.h"

#include "gauntlet/diag.h"
#include "gauntlet/json_mini.h"
#include "gauntlet/protocol.h"
#include "gauntlet/report.h"

#include <json-c/json.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <thread>
#include <vector>

namespace gauntlet {

const char* run_status_name(RunStatus s) {
    switch (s) {
        case RunStatus::IDLE:      return "idle";
        case RunStatus::RUNNING:   return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::CANCELLED: return "cancelled";
        case RunStatus::ERROR:     return "error";
    }
    return "idle";
}

namespace {

const char* const kCancelled = "Evaluation cancelled";
const char* const kTaskTimeout = "Task timeout exceeded";

// Small builder for event payloads.
class Payload {
public:
    Payload() : doc_(json_object_new_object()) {}
    Payload& str(const char* k, const std::string& v) {
        json_object_object_add(doc_.root, k, json_mini::new_string(v));
        return *this;
    }
    Payload& num(const char* k, int64_t v) {
        json_object_object_add(doc_.root, k, json_object_new_int64(v));
        return *this;
    }
    Payload& flag(const char* k, bool v) {
        json_object_object_add(doc_.root, k, json_object_new_boolean(v ? 1 : 0));
        return *this;
    }
    Payload& obj(const char* k, json_object* v) {
        json_object_object_add(doc_.root, k, v);
        return *this;
    }
    std::string json() const { return json_mini::to_string_plain(doc_.root); }

private:
    json_mini::Doc doc_;
};

std::string clip(const std::string& s, size_t n = 200) {
    if (s.size() <= n) return s;
    return s.substr(0, n) + "...";
}

} // namespace

Evaluator::Evaluator(EvalConfig cfg,
                     ITaskSource& tasks,
                     SandboxManager& sandboxes,
                     IMessenger& messenger,
                     MetricsAggregator& metrics,
                     JsonlLogger* events)
    : cfg_(std::move(cfg)),
      tasks_(tasks),
      sandboxes_(sandboxes),
      messenger_(messenger),
      metrics_(metrics),
      events_(events),
      verifier_(sandboxes, cfg_.verify_timeout_sec) {
    if (cfg_.max_turns < 1) cfg_.max_turns = 1;
    if (cfg_.task_timeout_sec < 1) cfg_.task_timeout_sec = 1;
    if (cfg_.workers < 1) cfg_.workers = 1;
}

void Evaluator::emit(const std::string& name, const std::string& payload_json) {
    if (!events_) return;
    events_->event(step_.fetch_add(1) + 1, name, payload_json);
}

void Evaluator::set_status(RunStatus s, const std::string& err) {
    std::lock_guard<std::mutex> lk(mu_);
    status_ = s;
    error_ = err;
}

RunStatus Evaluator::status() const {
    std::lock_guard<std::mutex> lk(mu_);
    return status_;
}

std::string Evaluator::last_error() const {
    std::lock_guard<std::mutex> lk(mu_);
    return error_;
}

std::string Evaluator::status_text() const {
    std::lock_guard<std::mutex> lk(mu_);
    switch (status_) {
        case RunStatus::IDLE:
            return "Evaluator is idle. Send 'run' to start evaluation.";
        case RunStatus::RUNNING: {
            std::string cur;
            for (const auto& t : in_flight_) {
                if (!cur.empty()) cur += ", ";
                cur += t;
            }
            return "Evaluation in progress. Current task: " + (cur.empty() ? std::string("none") : cur);
        }
        case RunStatus::COMPLETED:
            return "Evaluation completed. Results available.";
        case RunStatus::CANCELLED:
            return "Evaluation cancelled. Partial results available.";
        case RunStatus::ERROR:
            return "Status: error: " + error_;
    }
    return "Status: unknown";
}

EvaluationResult Evaluator::run_lifecycle(const Task& task,
                                          Clock::time_point start,
                                          std::string& handle,
                                          EvalState& state,
                                          int& turns) {
    EvaluationResult res;
    res.task_id = task.task_id;

    auto elapsed_sec = [&]() {
        return std::chrono::duration<double>(Clock::now() - start).count();
    };
    auto errored = [&](TaskStatus st, const std::string& msg) {
        state = EvalState::ERRORED;
        res.status = st;
        res.error = msg;
        res.turns = turns;
        return res;
    };

    // Created
    if (cancel_.cancelled()) return errored(TaskStatus::CANCELLED, kCancelled);
    SandboxCreateResult created = sandboxes_.create(task, &cancel_);
    handle = created.handle;
    if (!created.ok()) {
        if (cancel_.cancelled()) return errored(TaskStatus::CANCELLED, kCancelled);
        log_warn("evaluator", "task " + task.task_id + ": " + *created.error);
        return errored(TaskStatus::PROVISION_ERROR, *created.error);
    }
    emit("sandbox_created", Payload().str("task_id", task.task_id).str("handle", handle)
                                     .str("image", task.image).json());

    // InstructionSent
    state = EvalState::INSTRUCTION_SENT;
    MessengerReply reply = messenger_.send_instruction(make_instruction(task), &cancel_);

    // Looping
    state = EvalState::LOOPING;
    if (!reply.ok) {
        if (cancel_.cancelled()) return errored(TaskStatus::CANCELLED, kCancelled);
        return errored(TaskStatus::PROTOCOL_ERROR, reply.error);
    }

    while (turns < cfg_.max_turns) {
        if (cancel_.cancelled()) return errored(TaskStatus::CANCELLED, kCancelled);
        if (reply.action.kind == AgentAction::Kind::COMPLETE) {
            log_debug("evaluator", "task " + task.task_id + " complete: " + clip(reply.action.reasoning));
            break;
        }

        turns++;
        const CommandRequest& req = reply.action.command;
        CommandResult cr = sandboxes_.exec(handle, req, &cancel_);
        emit("turn", Payload().str("task_id", task.task_id).num("turn", turns)
                              .str("command", clip(req.command, 1000))
                              .num("exit_code", cr.exit_code).flag("timed_out", cr.timed_out).json());
        if (cancel_.cancelled()) return errored(TaskStatus::CANCELLED, kCancelled);

        reply = messenger_.send_command_result(task.task_id, cr, &cancel_);
        if (!reply.ok) {
            if (cancel_.cancelled()) return errored(TaskStatus::CANCELLED, kCancelled);
            return errored(TaskStatus::PROTOCOL_ERROR, reply.error);
        }

        if (elapsed_sec() > (double)cfg_.task_timeout_sec) {
            return errored(TaskStatus::TIMEOUT, kTaskTimeout);
        }
    }
    if (turns >= cfg_.max_turns && reply.action.kind == AgentAction::Kind::EXECUTE) {
        log_info("evaluator", "task " + task.task_id + " reached max turns (" +
                 std::to_string(cfg_.max_turns) + "), verifying anyway");
    }

    // Verifying
    state = EvalState::VERIFYING;
    VerificationOutcome v = verifier_.verify(handle, task, &cancel_);
    if (cancel_.cancelled()) return errored(TaskStatus::CANCELLED, kCancelled);
    emit("verify", Payload().str("task_id", task.task_id).flag("passed", v.passed)
                            .num("exit_code", v.exit_code).json());

    state = EvalState::FINALIZING;
    res.turns = turns;
    res.passed = v.passed;
    res.reward = v.reward;
    if (v.passed) {
        res.status = TaskStatus::PASSED;
    } else {
        res.status = TaskStatus::FAILED;
        res.error = (v.error && !v.error->empty())
            ? *v.error
            : "Verification failed with exit code " + std::to_string(v.exit_code);
    }
    return res;
}

EvaluationResult Evaluator::evaluate_task(const Task& task) {
    const auto start = Clock::now();
    {
        std::lock_guard<std::mutex> lk(mu_);
        in_flight_.insert(task.task_id);
    }
    emit("task_start", Payload().str("task_id", task.task_id).str("image", task.image).json());

    std::string handle;
    EvalState state = EvalState::CREATED;
    int turns = 0;
    EvaluationResult res;
    try {
        res = run_lifecycle(task, start, handle, state, turns);
    } catch (const std::exception& e) {
        state = EvalState::ERRORED;
        res = EvaluationResult{};
        res.task_id = task.task_id;
        res.turns = turns;
        res.status = TaskStatus::INTERNAL_ERROR;
        res.error = e.what();
        log_error("evaluator", "task " + task.task_id + " failed: " + e.what());
    }

    // Finalizing: on every path, including partial creation
    if (!handle.empty()) sandboxes_.destroy(handle);
    messenger_.end_session(task.task_id);

    if (state != EvalState::ERRORED) state = EvalState::TERMINATED;
    if (res.status != TaskStatus::PASSED) {
        res.passed = false;
        res.reward = 0.0;
    }
    res.final_state = state;
    res.total_time_sec = std::chrono::duration<double>(Clock::now() - start).count();

    {
        std::lock_guard<std::mutex> lk(mu_);
        in_flight_.erase(task.task_id);
    }
    emit("task_end", Payload().obj("result", result_to_json(res)).json());
    log_info("evaluator", "task " + task.task_id + ": " + task_status_name(res.status) +
             " (" + std::to_string(res.turns) + " turns)");
    return res;
}

void Evaluator::run_tasks(const std::vector<Task>& tasks) {
    const size_t workers = std::min<size_t>((size_t)cfg_.workers, tasks.size());
    if (workers <= 1) {
        for (const auto& t : tasks) {
            if (cancel_.cancelled()) break;
            metrics_.record(evaluate_task(t));
        }
        return;
    }

    std::atomic<size_t> next{0};
    std::mutex err_mu;
    std::exception_ptr first_error;
    std::vector<std::thread> th;
    th.reserve(workers);
    for (size_t w = 0; w < workers; w++) {
        th.emplace_back([&]() {
            while (true) {
                if (cancel_.cancelled()) return;
                {
                    std::lock_guard<std::mutex> lk(err_mu);
                    if (first_error) return;
                }
                size_t i = next.fetch_add(1);
                if (i >= tasks.size()) return;
                try {
                    metrics_.record(evaluate_task(tasks[i]));
                } catch (const std::exception&) {
                    std::lock_guard<std::mutex> lk(err_mu);
                    if (!first_error) first_error = std::current_exception();
                    return;
                }
            }
        });
    }
    for (auto& t : th) t.join();
    if (first_error) std::rethrow_exception(first_error);
}

AggregateMetrics Evaluator::run() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw std::runtime_error("Evaluation already in progress");
    }
    // a cancel raised before this point still stops the run; the token is
    // cleared only once the run is over
    struct RunningGuard {
        std::atomic<bool>& flag;
        CancelToken& cancel;
        ~RunningGuard() {
            cancel.reset();
            flag.store(false);
        }
    } guard{running_, cancel_};

    set_status(RunStatus::RUNNING);
    metrics_.reset();
    metrics_.set_dataset(cfg_.dataset);
    emit("run_start", Payload().str("dataset", cfg_.dataset).str("source", tasks_.describe())
                               .num("max_turns", cfg_.max_turns)
                               .num("task_timeout_sec", cfg_.task_timeout_sec)
                               .num("workers", cfg_.workers).json());

    try {
        std::vector<Task> tasks = tasks_.load();
        metrics_.set_total_tasks(tasks.size());
        log_info("evaluator", "loaded " + std::to_string(tasks.size()) + " tasks from " + tasks_.describe());
        run_tasks(tasks);
    } catch (const std::exception& e) {
        sandboxes_.destroy_all();
        set_status(RunStatus::ERROR, e.what());
        emit("run_error", Payload().str("error", e.what()).json());
        log_error("evaluator", std::string("run aborted: ") + e.what());
        throw;
    }

    sandboxes_.destroy_all();
    AggregateMetrics snap = metrics_.snapshot();
    const bool cancelled = cancel_.cancelled();
    set_status(cancelled ? RunStatus::CANCELLED : RunStatus::COMPLETED);
    emit("run_end", Payload().str("status", cancelled ? "cancelled" : "completed")
                             .num("total_tasks", (int64_t)snap.total_tasks)
                             .num("passed", (int64_t)snap.passed).json());
    return snap;
}

} // namespace gauntlet
