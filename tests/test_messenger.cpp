#include "test_common.h"
#include "gauntlet/json_mini.h"
#include "gauntlet/messenger.h"

#include <vector>

using namespace gauntlet;

namespace {

struct Sent {
    std::string url;
    std::string body;
    int timeout_sec;
};

std::string reply_with(const std::string& session, const std::string& agent_json) {
    json_mini::Doc root(json_object_new_object());
    json_object_object_add(root.root, "jsonrpc", json_object_new_string("2.0"));
    json_object* part = json_object_new_object();
    json_object_object_add(part, "type", json_object_new_string("text"));
    json_object_object_add(part, "text", json_mini::new_string(agent_json));
    json_object* parts = json_object_new_array();
    json_object_array_add(parts, part);
    json_object* art = json_object_new_object();
    json_object_object_add(art, "parts", parts);
    json_object* result = json_object_new_object();
    json_object_object_add(result, "sessionId", json_mini::new_string(session));
    json_object_object_add(result, "artifact", art);
    json_object_object_add(root.root, "result", result);
    return json_mini::to_string_plain(root.root);
}

HttpResponse ok_body(const std::string& body) {
    HttpResponse r;
    r.ok = true;
    r.status = 200;
    r.body = body;
    return r;
}

std::string payload_of(const std::string& rpc) {
    json_mini::Doc d = json_mini::parse(rpc);
    json_object* parts = json_mini::member(json_mini::member(json_mini::member(d.root, "params"), "message"), "parts");
    return json_mini::member_string(json_object_array_get_idx(parts, 0), "text").value_or("");
}

std::string session_of(const std::string& rpc) {
    json_mini::Doc d = json_mini::parse(rpc);
    return json_mini::member_string(json_mini::member(d.root, "params"), "sessionId").value_or("");
}

} // namespace

int main() {
    // Test 1: instruction then command result, session carried over
    {
        std::vector<Sent> sent;
        HttpTransport tr = [&](const std::string& url, const std::string& body, int t, const CancelToken*) {
            sent.push_back(Sent{url, body, t});
            if (sent.size() == 1)
                return ok_body(reply_with("sess-1", "{\"action\":\"execute\",\"command\":{\"command\":\"ls\"}}"));
            return ok_body(reply_with("sess-1", "{\"action\":\"complete\"}"));
        };
        A2AMessenger m("http://agent:9010//", 12, tr, 45);
        expect_true(m.endpoint() == "http://agent:9010/", "endpoint normalized: " + m.endpoint());

        Task t;
        t.task_id = "t1";
        t.instruction = "list files";
        auto r1 = m.send_instruction(make_instruction(t));
        expect_true(r1.ok, "instruction ok: " + r1.error);
        expect_true(r1.action.kind == AgentAction::Kind::EXECUTE, "first action is execute");
        expect_eq_ll(r1.action.command.timeout_sec, 45, "default command timeout from messenger");
        expect_true(session_of(sent[0].body).empty(), "first request has no session");
        expect_eq_ll(sent[0].timeout_sec, 12, "transport timeout");
        expect_true(m.session_for("t1").value_or("") == "sess-1", "session remembered");

        CommandResult cr;
        cr.exit_code = 0;
        cr.stdout_text = "a.txt\n";
        auto r2 = m.send_command_result("t1", cr);
        expect_true(r2.ok && r2.action.kind == AgentAction::Kind::COMPLETE, "second action is complete");
        expect_true(session_of(sent[1].body) == "sess-1", "session echoed back");
        expect_true(json_mini::get_string(payload_of(sent[1].body), "type").value_or("") == "command_result",
                    "command result payload");

        m.end_session("t1");
        expect_true(!m.session_for("t1"), "session dropped");
    }

    // Test 2: transport failure, HTTP error, cancellation
    {
        HttpTransport down = [](const std::string&, const std::string&, int, const CancelToken*) {
            HttpResponse r;
            r.error = "connection refused";
            return r;
        };
        A2AMessenger m("http://agent", 5, down);
        Task t;
        t.task_id = "t2";
        auto r = m.send_instruction(make_instruction(t));
        expect_true(!r.ok && r.error == "Transport error: connection refused", "transport error: " + r.error);

        HttpTransport http500 = [](const std::string&, const std::string&, int, const CancelToken*) {
            HttpResponse r;
            r.ok = true;
            r.status = 500;
            return r;
        };
        A2AMessenger m2("http://agent", 5, http500);
        auto r2 = m2.send_instruction(make_instruction(t));
        expect_true(!r2.ok && r2.error.find("HTTP 500") != std::string::npos, "http status error");

        int calls = 0;
        HttpTransport counting = [&](const std::string&, const std::string&, int, const CancelToken*) {
            calls++;
            return ok_body("{}");
        };
        A2AMessenger m3("http://agent", 5, counting);
        CancelToken tok;
        tok.cancel();
        auto r3 = m3.send_instruction(make_instruction(t), &tok);
        expect_true(!r3.ok && r3.error == "Evaluation cancelled", "cancelled before send");
        expect_eq_ll(calls, 0, "nothing sent after cancel");
    }

    // Test 3: malformed participant output
    {
        HttpTransport junk = [](const std::string&, const std::string&, int, const CancelToken*) {
            return ok_body(reply_with("s", "{\"action\":\"fly\"}"));
        };
        A2AMessenger m("http://agent", 5, junk);
        Task t;
        t.task_id = "t3";
        auto r = m.send_instruction(make_instruction(t));
        expect_true(!r.ok && r.error.find("unknown action") != std::string::npos, "unknown action: " + r.error);
    }

    // Test 4: a new instruction starts a new session
    {
        std::vector<std::string> bodies;
        HttpTransport tr = [&](const std::string&, const std::string& body, int, const CancelToken*) {
            bodies.push_back(body);
            return ok_body(reply_with("s-" + std::to_string(bodies.size()), "{\"action\":\"complete\"}"));
        };
        A2AMessenger m("http://agent", 5, tr);
        Task t;
        t.task_id = "t4";
        (void)m.send_instruction(make_instruction(t));
        (void)m.send_instruction(make_instruction(t));
        expect_true(session_of(bodies[1]).empty(), "second instruction does not reuse the old session");
    }

    std::cerr << "test_messenger: ALL PASSED" << std::endl;
    return 0;
}
