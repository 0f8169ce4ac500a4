#include "test_common.h"
#include "fakes.h"
#include "gauntlet/a2a_codec.h"
#include "gauntlet/diag.h"
#include "gauntlet/json_mini.h"
#include "gauntlet/request_handler.h"

#include <stdexcept>

using namespace gauntlet;
using gauntlet_test::FakeRuntime;
using gauntlet_test::ScriptedMessenger;
using gauntlet_test::complete_reply;

namespace {

RequestContext user_says(const std::string& text) {
    RequestContext ctx;
    ctx.task_id = "req-1";
    ctx.history.push_back(InboundMessage{"user", {text}});
    return ctx;
}

class EmptySource : public ITaskSource {
public:
    std::vector<Task> load() override { throw std::runtime_error("dataset unreadable"); }
    std::string describe() const override { return "empty"; }
};

} // namespace

int main() {
    set_log_threshold(LogLevel::ERROR);

    Task t;
    t.task_id = "only";
    t.instruction = "nothing to do";
    t.test_script = "true";

    FakeRuntime rt;
    SandboxManager mgr(rt, SandboxLimits{});
    ScriptedMessenger msg([](const std::string&, int, const CommandResult*) { return complete_reply(); });
    StaticTaskSource src({t});
    MetricsAggregator metrics;
    EvalConfig cfg;
    cfg.dataset = "mini";
    Evaluator ev(cfg, src, mgr, msg, metrics);
    RequestHandler h(ev);

    // Test 1: last_user_text
    {
        RequestContext ctx;
        expect_true(!last_user_text(ctx), "no messages");
        ctx.history.push_back(InboundMessage{"user", {"first"}});
        ctx.history.push_back(InboundMessage{"user", {"please", "run"}});
        ctx.history.push_back(InboundMessage{"agent", {"ok"}});
        expect_true(last_user_text(ctx).value_or("") == "please run", "last user message, parts joined");
    }

    // Test 2: no user message
    {
        RequestContext ctx;
        ctx.task_id = "x";
        ctx.history.push_back(InboundMessage{"agent", {"hi"}});
        auto ev1 = h.handle(ctx);
        expect_eq_ll((long long)ev1.size(), 1, "one event");
        expect_true(ev1[0].state == EventState::FAILED, "failed");
        expect_true(ev1[0].text.value_or("") == "Error: No user message found", "no user text");
        expect_true(ev1[0].task_id == "x", "task id carried");
    }

    // Test 3: status before any run, then help
    {
        auto s = h.handle(user_says("What is the STATUS?"));
        expect_true(s.size() == 1 && s[0].state == EventState::COMPLETED, "status completes");
        expect_true(s[0].text.value_or("") == "Evaluator is idle. Send 'run' to start evaluation.", "idle status");

        auto help = h.handle(user_says("hello there"));
        expect_true(help[0].text.value_or("").find("Gauntlet Evaluator Commands") == 0, "help text");
    }

    // Test 4: run -> working, then completed with the markdown results
    {
        auto evs = h.handle(user_says("Please evaluate now"));
        expect_eq_ll((long long)evs.size(), 2, "two events");
        expect_true(evs[0].state == EventState::WORKING && !evs[0].text, "working first");
        expect_true(evs[1].state == EventState::COMPLETED, "completed");
        const std::string md = evs[1].text.value_or("");
        expect_true(md.find("# Gauntlet Evaluation Results") == 0, "markdown header");
        expect_true(md.find("Dataset: mini") != std::string::npos, "dataset line");
        expect_true(md.find("Total Tasks: 1") != std::string::npos, "task count");
        expect_true(md.find("] only: 0 turns") != std::string::npos, "task line: " + md);

        auto s = h.handle(user_says("status"));
        expect_true(s[0].text.value_or("") == "Evaluation completed. Results available.", "completed status");
    }

    // Test 5: run failure -> failed event
    {
        FakeRuntime rt2;
        SandboxManager mgr2(rt2, SandboxLimits{});
        EmptySource bad;
        MetricsAggregator m2;
        Evaluator ev2(cfg, bad, mgr2, msg, m2);
        RequestHandler h2(ev2);
        auto evs = h2.handle(user_says("run"));
        expect_eq_ll((long long)evs.size(), 2, "working + failed");
        expect_true(evs[1].state == EventState::FAILED, "failed");
        expect_true(evs[1].text.value_or("") == "Error: dataset unreadable", "error text: " + evs[1].text.value_or(""));
        auto s = h2.handle(user_says("status"));
        expect_true(s[0].text.value_or("") == "Status: error: dataset unreadable", "error status");
    }

    // Test 6: JSON-RPC decode
    {
        auto call = parse_rpc_call(
            "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tasks/send\",\"params\":{\"id\":\"task-9\","
            "\"sessionId\":\"s-1\",\"message\":{\"role\":\"user\",\"parts\":[{\"type\":\"text\",\"text\":\"run\"}]}}}");
        expect_true(call.ok, "call ok: " + call.error);
        expect_true(call.id_json == "7", "numeric id kept");
        expect_true(call.ctx.task_id == "task-9", "task id");
        expect_true(call.session_id == "s-1", "session id");
        expect_true(last_user_text(call.ctx).value_or("") == "run", "text part");

        auto ms = parse_rpc_call(
            "{\"jsonrpc\":\"2.0\",\"id\":\"abc\",\"method\":\"message/send\",\"params\":{\"message\":"
            "{\"role\":\"user\",\"taskId\":\"t-2\",\"contextId\":\"c-2\",\"parts\":[{\"kind\":\"text\",\"text\":\"status\"}]}}}");
        expect_true(ms.ok && ms.ctx.task_id == "t-2" && ms.session_id == "c-2", "message/send ids");
        expect_true(last_user_text(ms.ctx).value_or("") == "status", "kind-tagged part");

        auto gen = parse_rpc_call(
            "{\"jsonrpc\":\"2.0\",\"method\":\"tasks/send\",\"params\":{\"message\":{\"role\":\"user\",\"parts\":[]}}}");
        expect_true(gen.ok && !gen.ctx.task_id.empty() && !gen.session_id.empty(), "generated ids");

        expect_eq_ll(parse_rpc_call("{").error_code, kRpcParseError, "parse error");
        expect_eq_ll(parse_rpc_call("[]").error_code, kRpcInvalidRequest, "invalid request");
        expect_eq_ll(parse_rpc_call("{\"id\":1,\"method\":\"tasks/get\"}").error_code, kRpcMethodNotFound,
                     "unknown method");
        expect_eq_ll(parse_rpc_call("{\"id\":1,\"method\":\"tasks/send\",\"params\":{}}").error_code,
                     kRpcInvalidParams, "missing message");
    }

    // Test 7: JSON-RPC encode
    {
        auto call = parse_rpc_call(
            "{\"jsonrpc\":\"2.0\",\"id\":\"q1\",\"method\":\"tasks/send\",\"params\":{\"id\":\"task-9\","
            "\"message\":{\"role\":\"user\",\"parts\":[{\"type\":\"text\",\"text\":\"status\"}]}}}");
        auto body = rpc_result(call, h.handle(call.ctx));
        json_mini::Doc d = json_mini::parse(body);
        expect_true(json_mini::member_string(d.root, "id").value_or("") == "q1", "id echoed");
        json_object* result = json_mini::member(d.root, "result");
        expect_true(json_mini::member_string(result, "id").value_or("") == "task-9", "task id");
        expect_true(json_mini::member_string(json_mini::member(result, "status"), "state").value_or("") == "completed",
                    "final state");
        json_object* parts = json_mini::member(json_mini::member(result, "artifact"), "parts");
        expect_true(json_mini::member_string(json_object_array_get_idx(parts, 0), "text").value_or("") ==
                    "Evaluation completed. Results available.", "artifact text");

        json_mini::Doc e = json_mini::parse(rpc_error("null", kRpcMethodNotFound, "Method not found: x"));
        json_object* err = json_mini::member(e.root, "error");
        expect_eq_ll(json_mini::member_int(err, "code").value_or(0), kRpcMethodNotFound, "error code");

        json_mini::Doc card = json_mini::parse(agent_card_json("http://127.0.0.1:9009/"));
        expect_true(json_mini::member_string(card.root, "url").value_or("") == "http://127.0.0.1:9009/", "card url");
        expect_true(json_mini::member(card.root, "skills") != nullptr, "card skills");
        expect_true(json_mini::member(card.root, "capabilities") != nullptr, "card capabilities");
    }

    std::cerr << "test_request_handler: ALL PASSED" << std::endl;
    return 0;
}
