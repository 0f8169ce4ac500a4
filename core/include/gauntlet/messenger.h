#pragma once

// Gauntlet messenger: request/response exchange with the participant.
//
// IMessenger is the seam the evaluator drives. A2AMessenger speaks A2A
// JSON-RPC over HTTP; the HTTP POST itself is an injectable function
// (default: a curl child process) so the codec runs offline in tests.

#include "gauntlet/cancel.h"
#include "gauntlet/protocol.h"
#include "gauntlet/types.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace gauntlet {

struct MessengerReply {
    bool ok{false};
    AgentAction action;
    std::string error;

    static MessengerReply success(AgentAction a) {
        MessengerReply r;
        r.ok = true;
        r.action = std::move(a);
        return r;
    }
    static MessengerReply failure(std::string msg) {
        MessengerReply r;
        r.error = std::move(msg);
        return r;
    }
};

class IMessenger {
public:
    virtual ~IMessenger() = default;

    virtual MessengerReply send_instruction(const TaskInstruction& ti,
                                            const CancelToken* cancel = nullptr) = 0;
    virtual MessengerReply send_command_result(const std::string& task_id,
                                               const CommandResult& result,
                                               const CancelToken* cancel = nullptr) = 0;

    // Drop per-task correlation state once the task is over.
    virtual void end_session(const std::string& task_id) { (void)task_id; }
};

struct HttpResponse {
    bool ok{false};       // request completed (any status)
    int status{0};
    std::string body;
    std::string error;
    bool cancelled{false};
};

using HttpTransport = std::function<HttpResponse(const std::string& url,
                                                 const std::string& body,
                                                 int timeout_sec,
                                                 const CancelToken* cancel)>;

// POST a JSON body with the curl CLI, bounded by timeout_sec and the token.
HttpResponse curl_post_json(const std::string& url,
                            const std::string& body,
                            int timeout_sec,
                            const CancelToken* cancel);

class A2AMessenger : public IMessenger {
public:
    // transport empty: curl_post_json.
    explicit A2AMessenger(std::string participant_url,
                          int timeout_sec = 60,
                          HttpTransport transport = HttpTransport{},
                          int default_command_timeout_sec = 30);

    MessengerReply send_instruction(const TaskInstruction& ti,
                                    const CancelToken* cancel = nullptr) override;
    MessengerReply send_command_result(const std::string& task_id,
                                       const CommandResult& result,
                                       const CancelToken* cancel = nullptr) override;
    void end_session(const std::string& task_id) override;

    std::optional<std::string> session_for(const std::string& task_id) const;
    const std::string& endpoint() const { return endpoint_; }

private:
    MessengerReply round_trip(const std::string& task_id,
                              const std::string& payload,
                              const CancelToken* cancel);

    std::string endpoint_;
    int timeout_sec_;
    HttpTransport transport_;
    int default_command_timeout_sec_;

    mutable std::mutex mu_;
    std::map<std::string, std::string> sessions_;
};

} // namespace gauntlet
