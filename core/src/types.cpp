#include "gauntlet/types.h"

namespace gauntlet {

const char* eval_state_name(EvalState s) {
    switch (s) {
        case EvalState::CREATED:          return "created";
        case EvalState::INSTRUCTION_SENT: return "instruction_sent";
        case EvalState::LOOPING:          return "looping";
        case EvalState::VERIFYING:        return "verifying";
        case EvalState::FINALIZING:       return "finalizing";
        case EvalState::TERMINATED:       return "terminated";
        case EvalState::ERRORED:          return "errored";
    }
    return "unknown";
}

const char* task_status_name(TaskStatus s) {
    switch (s) {
        case TaskStatus::PASSED:          return "PASSED";
        case TaskStatus::FAILED:          return "FAILED";
        case TaskStatus::PROVISION_ERROR: return "PROVISION_ERROR";
        case TaskStatus::PROTOCOL_ERROR:  return "PROTOCOL_ERROR";
        case TaskStatus::TIMEOUT:         return "TIMEOUT";
        case TaskStatus::CANCELLED:       return "CANCELLED";
        case TaskStatus::INTERNAL_ERROR:  return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

} // namespace gauntlet
