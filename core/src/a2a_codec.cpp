#include "gauntlet/a2a_codec.h"

#include "gauntlet/json_mini.h"
#include "gauntlet/log.h"

#include <json-c/json.h>

namespace gauntlet {

namespace {

InboundMessage message_from_json(json_object* msg) {
    InboundMessage m;
    m.role = json_mini::member_string(msg, "role").value_or("");
    json_object* parts = json_mini::member(msg, "parts");
    if (!parts || !json_object_is_type(parts, json_type_array)) return m;
    const size_t n = json_object_array_length(parts);
    for (size_t i = 0; i < n; i++) {
        json_object* p = json_object_array_get_idx(parts, (int)i);
        std::string kind = json_mini::member_string(p, "type").value_or(
                           json_mini::member_string(p, "kind").value_or(""));
        if (kind != "text") continue;
        if (auto t = json_mini::member_string(p, "text")) m.texts.push_back(*t);
    }
    return m;
}

json_object* text_artifact(const std::string& text) {
    json_object* part = json_object_new_object();
    json_object_object_add(part, "type", json_object_new_string("text"));
    json_object_object_add(part, "text", json_mini::new_string(text));
    json_object* parts = json_object_new_array();
    json_object_array_add(parts, part);
    json_object* art = json_object_new_object();
    json_object_object_add(art, "role", json_object_new_string("agent"));
    json_object_object_add(art, "parts", parts);
    return art;
}

} // namespace

RpcCall parse_rpc_call(const std::string& body) {
    RpcCall call;
    json_mini::Doc d = json_mini::parse(body);
    if (!d) {
        call.error_code = kRpcParseError;
        call.error = "Parse error";
        return call;
    }
    if (!json_mini::is_object(d.root)) {
        call.error_code = kRpcInvalidRequest;
        call.error = "Invalid Request";
        return call;
    }

    if (json_object* id = json_mini::member(d.root, "id")) {
        call.id_json = json_mini::to_string_plain(id);
    }
    auto method = json_mini::member_string(d.root, "method");
    if (!method) {
        call.error_code = kRpcInvalidRequest;
        call.error = "Invalid Request: missing method";
        return call;
    }
    call.method = *method;
    if (call.method != "tasks/send" && call.method != "message/send") {
        call.error_code = kRpcMethodNotFound;
        call.error = "Method not found: " + call.method;
        return call;
    }

    json_object* params = json_mini::member(d.root, "params");
    json_object* msg = json_mini::member(params, "message");
    if (!json_mini::is_object(msg)) {
        call.error_code = kRpcInvalidParams;
        call.error = "Invalid params: missing message";
        return call;
    }

    call.ctx.task_id = json_mini::member_string(params, "id").value_or(
                       json_mini::member_string(msg, "taskId").value_or(""));
    if (call.ctx.task_id.empty()) {
        auto sid = json_mini::member_string(d.root, "id");
        call.ctx.task_id = sid ? *sid : "task-" + gen_run_id().substr(0, 12);
    }
    call.session_id = json_mini::member_string(params, "sessionId").value_or(
                      json_mini::member_string(msg, "contextId").value_or(""));
    if (call.session_id.empty()) call.session_id = "session-" + gen_run_id().substr(0, 12);

    json_object* history = json_mini::member(params, "history");
    if (history && json_object_is_type(history, json_type_array)) {
        const size_t n = json_object_array_length(history);
        for (size_t i = 0; i < n; i++) {
            call.ctx.history.push_back(message_from_json(json_object_array_get_idx(history, (int)i)));
        }
    }
    call.ctx.history.push_back(message_from_json(msg));

    call.ok = true;
    return call;
}

std::string rpc_result(const RpcCall& call, const std::vector<OutboundEvent>& events) {
    json_mini::Doc root(json_object_new_object());
    json_object_object_add(root.root, "jsonrpc", json_object_new_string("2.0"));
    json_mini::Doc id = json_mini::parse(call.id_json);
    json_object_object_add(root.root, "id", id.release());

    json_object* result = json_object_new_object();
    json_object_object_add(result, "id", json_mini::new_string(call.ctx.task_id));
    json_object_object_add(result, "sessionId", json_mini::new_string(call.session_id));

    EventState final_state = events.empty() ? EventState::FAILED : events.back().state;
    json_object* status = json_object_new_object();
    json_object_object_add(status, "state", json_object_new_string(event_state_name(final_state)));
    json_object_object_add(result, "status", status);

    json_object* hist = json_object_new_array();
    const OutboundEvent* last_text = nullptr;
    for (const auto& ev : events) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "state", json_object_new_string(event_state_name(ev.state)));
        if (ev.text) {
            json_object_object_add(e, "artifact", text_artifact(*ev.text));
            last_text = &ev;
        }
        json_object_array_add(hist, e);
    }
    if (last_text) json_object_object_add(result, "artifact", text_artifact(*last_text->text));
    json_object_object_add(result, "history", hist);

    json_object_object_add(root.root, "result", result);
    return json_mini::to_string_plain(root.root);
}

std::string rpc_error(const std::string& id_json, int code, const std::string& message) {
    json_mini::Doc root(json_object_new_object());
    json_object_object_add(root.root, "jsonrpc", json_object_new_string("2.0"));
    json_mini::Doc id = json_mini::parse(id_json);
    json_object_object_add(root.root, "id", id.release());
    json_object* err = json_object_new_object();
    json_object_object_add(err, "code", json_object_new_int(code));
    json_object_object_add(err, "message", json_mini::new_string(message));
    json_object_object_add(root.root, "error", err);
    return json_mini::to_string_plain(root.root);
}

std::string agent_card_json(const std::string& url) {
    json_mini::Doc root(json_object_new_object());
    json_object_object_add(root.root, "name", json_object_new_string("Gauntlet Evaluator"));
    json_object_object_add(root.root, "description",
        json_object_new_string("Orchestrates terminal-agent evaluation tasks in isolated sandboxes"));
    json_object_object_add(root.root, "url", json_mini::new_string(url));
    json_object_object_add(root.root, "version", json_object_new_string("0.1.0"));

    json_object* caps = json_object_new_object();
    json_object_object_add(caps, "streaming", json_object_new_boolean(0));
    json_object_object_add(caps, "pushNotifications", json_object_new_boolean(0));
    json_object_object_add(root.root, "capabilities", caps);

    json_object* modes = json_object_new_array();
    json_object_array_add(modes, json_object_new_string("text"));
    json_object_object_add(root.root, "defaultInputModes", modes);
    json_object_object_add(root.root, "defaultOutputModes", json_object_get(modes));

    json_object* skill = json_object_new_object();
    json_object_object_add(skill, "id", json_object_new_string("evaluate"));
    json_object_object_add(skill, "name", json_object_new_string("Evaluate terminal tasks"));
    json_object_object_add(skill, "description",
        json_object_new_string("Load tasks and evaluate them against a participant agent"));
    json_object* tags = json_object_new_array();
    for (const char* t : {"evaluation", "benchmark", "terminal"}) {
        json_object_array_add(tags, json_object_new_string(t));
    }
    json_object_object_add(skill, "tags", tags);
    json_object* skills = json_object_new_array();
    json_object_array_add(skills, skill);
    json_object_object_add(root.root, "skills", skills);

    return json_mini::to_string_plain(root.root);
}

} // namespace gauntlet
