#include "test_common.h"
#include "gauntlet/json_mini.h"
#include "gauntlet/protocol.h"

using namespace gauntlet;

int main() {
    // Test 1: task instruction payload
    {
        Task t;
        t.task_id = "t1";
        t.instruction = "make \"hello\"";
        t.working_directory = "/work";
        t.environment["LANG"] = "C";
        std::string s = encode_instruction(make_instruction(t));
        json_mini::Doc d = json_mini::parse(s);
        expect_true((bool)d, "instruction is JSON");
        expect_true(json_mini::member_string(d.root, "type").value_or("") == "task_instruction", "type");
        expect_true(json_mini::member_string(d.root, "task_id").value_or("") == "t1", "task_id");
        expect_true(json_mini::member_string(d.root, "instruction").value_or("") == "make \"hello\"", "instruction");
        json_object* ctx = json_mini::member(d.root, "context");
        expect_true(json_mini::member_string(ctx, "working_directory").value_or("") == "/work", "workdir");
        auto env = json_mini::member_string_map(ctx, "environment");
        expect_true(env.size() == 1 && env["LANG"] == "C", "environment");
    }

    // Test 2: command result payload
    {
        CommandResult r;
        r.stdout_text = "out";
        r.stderr_text = "err";
        r.exit_code = -1;
        r.timed_out = true;
        json_mini::Doc d = json_mini::parse(encode_command_result("t1", r));
        expect_true(json_mini::member_string(d.root, "type").value_or("") == "command_result", "type");
        expect_true(json_mini::member_string(d.root, "stdout").value_or("") == "out", "stdout");
        expect_true(json_mini::member_string(d.root, "stderr").value_or("") == "err", "stderr");
        expect_eq_ll(json_mini::member_int(d.root, "exit_code").value_or(0), -1, "exit_code");
        expect_true(json_mini::member_bool(d.root, "timed_out").value_or(false), "timed_out");
    }

    // Test 3: JSON-RPC envelope
    {
        json_mini::Doc d = json_mini::parse(build_rpc_request("t1", "{\"x\":1}", std::string("s-9")));
        expect_true(json_mini::member_string(d.root, "jsonrpc").value_or("") == "2.0", "jsonrpc");
        expect_true(json_mini::member_string(d.root, "method").value_or("") == "tasks/send", "method");
        json_object* params = json_mini::member(d.root, "params");
        expect_true(json_mini::member_string(params, "sessionId").value_or("") == "s-9", "sessionId");
        json_object* parts = json_mini::member(json_mini::member(params, "message"), "parts");
        json_object* p0 = json_object_array_get_idx(parts, 0);
        expect_true(json_mini::member_string(p0, "text").value_or("") == "{\"x\":1}", "payload text");

        json_mini::Doc d2 = json_mini::parse(build_rpc_request("t1", "x", std::nullopt));
        expect_true(!json_mini::member(json_mini::member(d2.root, "params"), "sessionId"),
                    "no sessionId before the participant assigns one");
    }

    // Test 4: agent responses
    {
        auto a = parse_agent_response(
            "{\"action\":\"execute\",\"command\":{\"command\":\"ls\",\"timeout\":5,\"workdir\":\"/tmp\"},"
            "\"reasoning\":\"look\"}");
        expect_true(a.ok, "execute parses");
        expect_true(a.action.kind == AgentAction::Kind::EXECUTE, "execute kind");
        expect_true(a.action.command.command == "ls", "command text");
        expect_eq_ll(a.action.command.timeout_sec, 5, "timeout");
        expect_true(a.action.command.workdir.value_or("") == "/tmp", "workdir");
        expect_true(a.action.reasoning == "look", "reasoning");

        auto b = parse_agent_response("{\"action\":\"execute\",\"command\":{\"command\":\"ls\"}}", 17);
        expect_eq_ll(b.action.command.timeout_sec, 17, "default timeout applied");
        expect_true(!b.action.command.workdir, "no workdir");

        auto c = parse_agent_response("{\"action\":\"complete\",\"reasoning\":\"done\"}");
        expect_true(c.ok && c.action.kind == AgentAction::Kind::COMPLETE, "complete parses");

        expect_true(!parse_agent_response("not json").ok, "not json");
        expect_true(!parse_agent_response("[1,2]").ok, "not an object");
        expect_true(!parse_agent_response("{\"reasoning\":\"x\"}").ok, "missing action");
        auto d = parse_agent_response("{\"action\":\"dance\"}");
        expect_true(!d.ok && d.error.find("dance") != std::string::npos, "unknown action named");
        expect_true(!parse_agent_response("{\"action\":\"execute\"}").ok, "execute without command");
        expect_true(!parse_agent_response("{\"action\":\"execute\",\"command\":{\"command\":\"\"}}").ok,
                    "empty command");
    }

    // Test 4b: out-of-range numeric timeouts fall back or clamp
    {
        auto huge = parse_agent_response("{\"action\":\"execute\",\"command\":{\"command\":\"ls\",\"timeout\":1e300}}");
        expect_true(huge.ok, "huge timeout still parses");
        expect_eq_ll(huge.action.command.timeout_sec, 30, "1e300 ignored, default kept");
        auto neg = parse_agent_response("{\"action\":\"execute\",\"command\":{\"command\":\"ls\",\"timeout\":-1e300}}");
        expect_eq_ll(neg.action.command.timeout_sec, 30, "-1e300 ignored");
        auto frac = parse_agent_response("{\"action\":\"execute\",\"command\":{\"command\":\"ls\",\"timeout\":45.9}}");
        expect_eq_ll(frac.action.command.timeout_sec, 45, "fractional truncated");
        auto big = parse_agent_response("{\"action\":\"execute\",\"command\":{\"command\":\"ls\",\"timeout\":1000000000000}}");
        expect_eq_ll(big.action.command.timeout_sec, 24 * 3600, "large integer clamped to a day");

        json_mini::Doc d = json_mini::parse("{\"a\":1e19,\"b\":-9.3e18,\"c\":12.0}");
        expect_true(!json_mini::member_int(d.root, "a"), "above int64 range");
        expect_true(!json_mini::member_int(d.root, "b"), "below int64 range");
        expect_eq_ll(json_mini::member_int(d.root, "c").value_or(0), 12, "in-range double");
    }

    // Test 5: JSON-RPC replies
    {
        auto r = parse_rpc_reply(
            "{\"jsonrpc\":\"2.0\",\"id\":\"t1\",\"result\":{\"sessionId\":\"abc\",\"artifact\":{\"parts\":"
            "[{\"type\":\"text\",\"text\":\"{\\\"action\\\":\\\"execute\\\",\\\"command\\\":{\\\"command\\\":\\\"pwd\\\"}}\"}]}}}");
        expect_true(r.ok, "reply ok: " + r.error);
        expect_true(r.session_id.value_or("") == "abc", "session id");
        expect_true(r.action.kind == AgentAction::Kind::EXECUTE && r.action.command.command == "pwd", "action");

        auto e = parse_rpc_reply("{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":{\"code\":-1,\"message\":\"boom\"}}");
        expect_true(!e.ok && e.error == "Agent error: boom", "rpc error: " + e.error);

        auto m = parse_rpc_reply("<html>");
        expect_true(!m.ok && m.error.find("Malformed") != std::string::npos, "malformed body");

        auto txt = parse_rpc_reply(
            "{\"result\":{\"artifact\":{\"parts\":[{\"type\":\"text\",\"text\":\"All done.\"}]}}}");
        expect_true(txt.ok && txt.action.kind == AgentAction::Kind::COMPLETE, "plain text -> complete");
        expect_true(txt.action.reasoning == "All done.", "plain text kept as reasoning");

        auto none = parse_rpc_reply("{\"result\":{}}");
        expect_true(none.ok && none.action.kind == AgentAction::Kind::COMPLETE, "no parts -> complete");
        expect_true(none.action.reasoning == "No response", "no parts reasoning");

        auto bad = parse_rpc_reply(
            "{\"result\":{\"artifact\":{\"parts\":[{\"type\":\"text\",\"text\":\"{\\\"action\\\":1}\"}]}}}");
        expect_true(!bad.ok && bad.error.find("Invalid agent response") != std::string::npos,
                    "JSON without valid action is a protocol error");
    }

    std::cerr << "test_protocol: ALL PASSED" << std::endl;
    return 0;
}
