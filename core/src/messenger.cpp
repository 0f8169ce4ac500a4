#include "gauntlet/messenger.h"

#include "gauntlet/diag.h"
#include "gauntlet/proc.h"

#include <algorithm>

namespace gauntlet {

static constexpr const char* kStatusMarker = "\n__gauntlet_http_status__:";

HttpResponse curl_post_json(const std::string& url,
                            const std::string& body,
                            int timeout_sec,
                            const CancelToken* cancel) {
    HttpResponse resp;
    const int t = std::max(1, timeout_sec);
    std::vector<std::string> argv = {
        "curl", "-sS", "-X", "POST",
        "-H", "Content-Type: application/json",
        "--data-binary", "@-",
        "--max-time", std::to_string(t),
        "-w", std::string(kStatusMarker) + "%{http_code}",
        url,
    };

    ProcLimits lim;
    lim.timeout_ms = (t + 5) * 1000;
    lim.stdout_max_bytes = 8 * 1024 * 1024;
    lim.cancel_flag = cancel ? cancel->flag() : nullptr;
    ProcResult pr;
    if (!proc_run_capture_stdin(argv, "", body, lim, &pr)) {
        resp.error = "curl failed to start: " + pr.error;
        return resp;
    }
    if (pr.cancelled) {
        resp.cancelled = true;
        resp.error = "Evaluation cancelled";
        return resp;
    }
    if (pr.timed_out) {
        resp.error = "request to " + url + " timed out after " + std::to_string(t) + "s";
        return resp;
    }
    if (pr.exit_code != 0) {
        std::string e = pr.err_output;
        while (!e.empty() && (e.back() == '\n' || e.back() == '\r')) e.pop_back();
        resp.error = "curl exit " + std::to_string(pr.exit_code) + (e.empty() ? "" : ": " + e);
        return resp;
    }

    size_t pos = pr.output.rfind(kStatusMarker);
    if (pos == std::string::npos) {
        resp.error = "no HTTP status in curl output";
        return resp;
    }
    try {
        resp.status = std::stoi(pr.output.substr(pos + std::char_traits<char>::length(kStatusMarker)));
    } catch (const std::exception&) {
        resp.error = "unparsable HTTP status in curl output";
        return resp;
    }
    resp.body = pr.output.substr(0, pos);
    resp.ok = true;
    return resp;
}

A2AMessenger::A2AMessenger(std::string participant_url,
                           int timeout_sec,
                           HttpTransport transport,
                           int default_command_timeout_sec)
    : timeout_sec_(std::max(1, timeout_sec)),
      transport_(transport ? std::move(transport) : HttpTransport(curl_post_json)),
      default_command_timeout_sec_(std::max(1, default_command_timeout_sec)) {
    while (!participant_url.empty() && participant_url.back() == '/') participant_url.pop_back();
    endpoint_ = participant_url + "/";
}

std::optional<std::string> A2AMessenger::session_for(const std::string& task_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(task_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

void A2AMessenger::end_session(const std::string& task_id) {
    std::lock_guard<std::mutex> lk(mu_);
    sessions_.erase(task_id);
}

MessengerReply A2AMessenger::send_instruction(const TaskInstruction& ti, const CancelToken* cancel) {
    end_session(ti.task_id);  // a new instruction starts a new conversation
    return round_trip(ti.task_id, encode_instruction(ti), cancel);
}

MessengerReply A2AMessenger::send_command_result(const std::string& task_id,
                                                 const CommandResult& result,
                                                 const CancelToken* cancel) {
    return round_trip(task_id, encode_command_result(task_id, result), cancel);
}

MessengerReply A2AMessenger::round_trip(const std::string& task_id,
                                        const std::string& payload,
                                        const CancelToken* cancel) {
    if (cancel && cancel->cancelled()) return MessengerReply::failure("Evaluation cancelled");

    const std::string request = build_rpc_request(task_id, payload, session_for(task_id));
    HttpResponse resp = transport_(endpoint_, request, timeout_sec_, cancel);
    if (resp.cancelled) return MessengerReply::failure("Evaluation cancelled");
    if (!resp.ok) return MessengerReply::failure("Transport error: " + resp.error);
    if (resp.status < 200 || resp.status >= 300) {
        return MessengerReply::failure("Transport error: HTTP " + std::to_string(resp.status) +
                                       " from " + endpoint_);
    }

    RpcReply rr = parse_rpc_reply(resp.body, default_command_timeout_sec_);
    if (rr.session_id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_[task_id] = *rr.session_id;
    }
    if (!rr.ok) {
        log_debug("messenger", "task " + task_id + ": " + rr.error);
        return MessengerReply::failure(rr.error);
    }
    return MessengerReply::success(std::move(rr.action));
}

} // namespace gauntlet
