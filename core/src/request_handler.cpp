#include "gauntlet/request_handler.h"

#include "gauntlet/diag.h"
#include "gauntlet/report.h"

#include <algorithm>
#include <cctype>
#include <exception>

namespace gauntlet {

const char* event_state_name(EventState s) {
    switch (s) {
        case EventState::WORKING:   return "working";
        case EventState::COMPLETED: return "completed";
        case EventState::FAILED:    return "failed";
    }
    return "failed";
}

std::optional<std::string> last_user_text(const RequestContext& ctx) {
    for (auto it = ctx.history.rbegin(); it != ctx.history.rend(); ++it) {
        if (it->role != "user") continue;
        std::string out;
        for (const auto& t : it->texts) {
            if (!out.empty()) out += " ";
            out += t;
        }
        return out;
    }
    return std::nullopt;
}

std::string RequestHandler::help_text() {
    return "Gauntlet Evaluator Commands:\n"
           "\n"
           "- \"run\" or \"evaluate\": Start the evaluation\n"
           "- \"status\": Get current evaluation status\n"
           "\n"
           "The evaluator will:\n"
           "1. Load tasks from the configured dataset\n"
           "2. Create an isolated sandbox for each task\n"
           "3. Send task instructions to the participant agent\n"
           "4. Execute returned commands in the sandbox\n"
           "5. Run test scripts to verify completion\n"
           "6. Report aggregate results\n";
}

std::vector<OutboundEvent> RequestHandler::handle(const RequestContext& ctx) {
    std::vector<OutboundEvent> events;
    auto push = [&](EventState st, std::optional<std::string> text) {
        events.push_back(OutboundEvent{ctx.task_id, st, std::move(text)});
    };

    auto text = last_user_text(ctx);
    if (!text) {
        push(EventState::FAILED, std::string("Error: No user message found"));
        return events;
    }

    std::string lower = *text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    if (lower.find("run") != std::string::npos || lower.find("evaluate") != std::string::npos) {
        push(EventState::WORKING, std::nullopt);
        try {
            AggregateMetrics m = evaluator_.run();
            push(EventState::COMPLETED, format_results_markdown(m));
        } catch (const std::exception& e) {
            log_warn("handler", std::string("evaluation request failed: ") + e.what());
            push(EventState::FAILED, std::string("Error: ") + e.what());
        }
        return events;
    }

    if (lower.find("status") != std::string::npos) {
        push(EventState::COMPLETED, evaluator_.status_text());
        return events;
    }

    push(EventState::COMPLETED, help_text());
    return events;
}

} // namespace gauntlet
