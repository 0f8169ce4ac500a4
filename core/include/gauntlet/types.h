#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gauntlet {

// One benchmark unit. Built once by a task source, never mutated afterwards.
struct Task {
    std::string task_id;
    std::string instruction;
    std::string working_directory{"/workspace"};
    std::map<std::string, std::string> environment;
    std::string test_script;
    std::string image{"ubuntu:22.04"};
    std::vector<std::string> setup_commands;
    double expected_reward{1.0};
    std::set<std::string> tags;
};

struct CommandRequest {
    std::string command;
    int timeout_sec{30};
    std::optional<std::string> workdir;
};

// exit_code -1 is reserved for "not executed / infrastructure failure".
struct CommandResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{-1};
    bool timed_out{false};
};

// Participant action: either run a command or declare the task complete.
struct AgentAction {
    enum class Kind { EXECUTE, COMPLETE } kind{Kind::COMPLETE};
    CommandRequest command;  // meaningful only for EXECUTE
    std::string reasoning;

    static AgentAction execute(CommandRequest req, std::string why = "") {
        AgentAction a;
        a.kind = Kind::EXECUTE;
        a.command = std::move(req);
        a.reasoning = std::move(why);
        return a;
    }
    static AgentAction complete(std::string why = "") {
        AgentAction a;
        a.kind = Kind::COMPLETE;
        a.reasoning = std::move(why);
        return a;
    }
};

// Per-task lifecycle states.
enum class EvalState {
    CREATED,
    INSTRUCTION_SENT,
    LOOPING,
    VERIFYING,
    FINALIZING,
    TERMINATED,
    ERRORED,
};

// How a task ended. PASSED and FAILED both mean verification ran.
enum class TaskStatus {
    PASSED,
    FAILED,
    PROVISION_ERROR,
    PROTOCOL_ERROR,
    TIMEOUT,
    CANCELLED,
    INTERNAL_ERROR,
};

struct EvaluationResult {
    std::string task_id;
    bool passed{false};
    double reward{0.0};
    int turns{0};
    double total_time_sec{0.0};
    std::optional<std::string> error;
    TaskStatus status{TaskStatus::INTERNAL_ERROR};
    EvalState final_state{EvalState::TERMINATED};
};

struct AggregateMetrics {
    std::string dataset;
    size_t total_tasks{0};
    size_t passed{0};
    size_t failed{0};
    double pass_rate{0.0};
    double avg_turns{0.0};
    double avg_time_sec{0.0};
    double total_reward{0.0};
    std::vector<EvaluationResult> results;
};

const char* eval_state_name(EvalState s);
const char* task_status_name(TaskStatus s);

} // namespace gauntlet
