#pragma once

// Inbound requests to the evaluator, independent of any server.
//
// The last user message of the request history picks the operation:
// text containing "run" or "evaluate" starts an evaluation, "status" reports
// the evaluator status, anything else returns the help text.

#include "gauntlet/evaluator.h"

#include <optional>
#include <string>
#include <vector>

namespace gauntlet {

struct InboundMessage {
    std::string role;                // "user" | "agent"
    std::vector<std::string> texts;  // text parts in order
};

struct RequestContext {
    std::string task_id;
    std::vector<InboundMessage> history;
};

enum class EventState { WORKING, COMPLETED, FAILED };

const char* event_state_name(EventState s);

struct OutboundEvent {
    std::string task_id;
    EventState state{EventState::WORKING};
    std::optional<std::string> text;
};

class RequestHandler {
public:
    explicit RequestHandler(Evaluator& evaluator) : evaluator_(evaluator) {}

    // Runs the evaluation synchronously when asked to; the returned events
    // are in emission order (working, then completed or failed).
    std::vector<OutboundEvent> handle(const RequestContext& ctx);

    static std::string help_text();

private:
    Evaluator& evaluator_;
};

// Text parts of the last user message joined with spaces; nullopt when the
// history holds no user message.
std::optional<std::string> last_user_text(const RequestContext& ctx);

} // namespace gauntlet
