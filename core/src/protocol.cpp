#include "gauntlet/protocol.h"

#include "gauntlet/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <cstdint>

namespace gauntlet {

using json_mini::Doc;

TaskInstruction make_instruction(const Task& task) {
    TaskInstruction ti;
    ti.task_id = task.task_id;
    ti.instruction = task.instruction;
    ti.working_directory = task.working_directory;
    ti.environment = task.environment;
    return ti;
}

std::string encode_instruction(const TaskInstruction& ti) {
    Doc root(json_object_new_object());
    json_object_object_add(root.root, "type", json_object_new_string("task_instruction"));
    json_object_object_add(root.root, "task_id", json_mini::new_string(ti.task_id));
    json_object_object_add(root.root, "instruction", json_mini::new_string(ti.instruction));

    json_object* ctx = json_object_new_object();
    json_object_object_add(ctx, "working_directory", json_mini::new_string(ti.working_directory));
    json_object* env = json_object_new_object();
    for (const auto& kv : ti.environment) {
        json_object_object_add(env, kv.first.c_str(), json_mini::new_string(kv.second));
    }
    json_object_object_add(ctx, "environment", env);
    json_object_object_add(root.root, "context", ctx);

    return json_mini::to_string_plain(root.root);
}

std::string encode_command_result(const std::string& task_id, const CommandResult& r) {
    Doc root(json_object_new_object());
    json_object_object_add(root.root, "type", json_object_new_string("command_result"));
    json_object_object_add(root.root, "task_id", json_mini::new_string(task_id));
    json_object_object_add(root.root, "stdout", json_mini::new_string(r.stdout_text));
    json_object_object_add(root.root, "stderr", json_mini::new_string(r.stderr_text));
    json_object_object_add(root.root, "exit_code", json_object_new_int(r.exit_code));
    json_object_object_add(root.root, "timed_out", json_object_new_boolean(r.timed_out ? 1 : 0));
    return json_mini::to_string_plain(root.root);
}

std::string build_rpc_request(const std::string& rpc_id,
                              const std::string& payload_text,
                              const std::optional<std::string>& session_id) {
    Doc root(json_object_new_object());
    json_object_object_add(root.root, "jsonrpc", json_object_new_string("2.0"));
    json_object_object_add(root.root, "method", json_object_new_string("tasks/send"));
    json_object_object_add(root.root, "id", json_mini::new_string(rpc_id));

    json_object* part = json_object_new_object();
    json_object_object_add(part, "type", json_object_new_string("text"));
    json_object_object_add(part, "text", json_mini::new_string(payload_text));
    json_object* parts = json_object_new_array();
    json_object_array_add(parts, part);

    json_object* msg = json_object_new_object();
    json_object_object_add(msg, "role", json_object_new_string("user"));
    json_object_object_add(msg, "parts", parts);

    json_object* params = json_object_new_object();
    json_object_object_add(params, "message", msg);
    if (session_id && !session_id->empty()) {
        json_object_object_add(params, "sessionId", json_mini::new_string(*session_id));
    }
    json_object_object_add(root.root, "params", params);

    return json_mini::to_string_plain(root.root);
}

namespace {

ParsedAction action_from_object(json_object* obj, int default_timeout_sec) {
    ParsedAction out;
    if (!json_mini::is_object(obj)) {
        out.error = "Invalid agent response: not a JSON object";
        return out;
    }

    auto action = json_mini::member_string(obj, "action");
    if (!action) {
        out.error = "Invalid agent response: missing action";
        return out;
    }
    std::string reasoning = json_mini::member_string(obj, "reasoning").value_or("");

    if (*action == "complete") {
        out.ok = true;
        out.action = AgentAction::complete(reasoning);
        return out;
    }
    if (*action != "execute") {
        out.error = "Invalid agent response: unknown action '" + *action + "'";
        return out;
    }

    json_object* cmd = json_mini::member(obj, "command");
    auto text = json_mini::member_string(cmd, "command");
    if (!text || text->empty()) {
        out.error = "Invalid agent response: execute without command";
        return out;
    }

    CommandRequest req;
    req.command = *text;
    req.timeout_sec = default_timeout_sec;
    if (auto t = json_mini::member_int(cmd, "timeout")) {
        if (*t > 0) req.timeout_sec = (int)std::min<int64_t>(*t, 24 * 3600);
    }
    if (auto wd = json_mini::member_string(cmd, "workdir")) {
        if (!wd->empty()) req.workdir = *wd;
    }

    out.ok = true;
    out.action = AgentAction::execute(std::move(req), reasoning);
    return out;
}

} // namespace

ParsedAction parse_agent_response(const std::string& json_text, int default_timeout_sec) {
    Doc d = json_mini::parse(json_text);
    if (!d) {
        ParsedAction out;
        out.error = "Invalid agent response: not valid JSON";
        return out;
    }
    return action_from_object(d.root, default_timeout_sec);
}

RpcReply parse_rpc_reply(const std::string& body, int default_timeout_sec) {
    RpcReply out;
    Doc d = json_mini::parse(body);
    if (!json_mini::is_object(d.root)) {
        out.error = "Malformed JSON-RPC response from participant";
        return out;
    }

    if (json_object* err = json_mini::member(d.root, "error")) {
        std::string detail;
        if (auto m = json_mini::member_string(err, "message")) detail = *m;
        else detail = json_mini::to_string_plain(err);
        out.error = "Agent error: " + detail;
        return out;
    }

    json_object* result = json_mini::member(d.root, "result");
    if (auto sid = json_mini::member_string(result, "sessionId")) {
        out.session_id = *sid;
    }

    json_object* parts = json_mini::member(json_mini::member(result, "artifact"), "parts");
    if (parts && json_object_is_type(parts, json_type_array)) {
        const size_t n = json_object_array_length(parts);
        for (size_t i = 0; i < n; i++) {
            json_object* part = json_object_array_get_idx(parts, (int)i);
            if (json_mini::member_string(part, "type").value_or("") != "text") continue;
            std::string text = json_mini::member_string(part, "text").value_or("");

            Doc inner = json_mini::parse(text);
            if (!inner) {
                out.ok = true;
                out.action = AgentAction::complete(text);
                return out;
            }
            ParsedAction pa = action_from_object(inner.root, default_timeout_sec);
            out.ok = pa.ok;
            out.action = std::move(pa.action);
            out.error = std::move(pa.error);
            return out;
        }
    }

    out.ok = true;
    out.action = AgentAction::complete("No response");
    return out;
}

} // namespace gauntlet
