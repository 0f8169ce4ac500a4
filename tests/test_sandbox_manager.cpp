#include "test_common.h"
#include "fakes.h"
#include "gauntlet/sandbox_manager.h"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace gauntlet;
using gauntlet_test::FakeRuntime;

static Task make_task(const std::string& id, const std::string& image = "ubuntu:22.04") {
    Task t;
    t.task_id = id;
    t.instruction = "x";
    t.test_script = "true";
    t.image = image;
    return t;
}

int main() {
    SandboxLimits limits;
    limits.memory_mb = 256;
    limits.cpu_percent = 25;

    // Test 1: create, exec, destroy
    {
        FakeRuntime rt;
        SandboxManager mgr(rt, limits);
        Task t = make_task("task/1");
        t.environment["FOO"] = "bar";
        auto c = mgr.create(t);
        expect_true(c.ok(), "create ok");
        expect_true(c.handle == "sbx-000001", "first handle: " + c.handle);
        expect_true(mgr.is_live(c.handle), "live after create");
        expect_eq_ll((long long)mgr.live_count(), 1, "one live sandbox");
        expect_eq_ll((long long)rt.count("start:"), 1, "started");
        expect_eq_ll((long long)rt.count("pull:"), 0, "no pull for present image");

        SandboxSpec spec = rt.spec_of("env1");
        expect_true(spec.image == "ubuntu:22.04", "spec image");
        expect_true(spec.environment.at("FOO") == "bar", "spec environment");
        expect_eq_ll(spec.limits.memory_mb, 256, "spec memory limit");
        expect_eq_ll(spec.limits.cpu_percent, 25, "spec cpu limit");
        expect_true(spec.labels.at("gauntlet.task") == "task/1", "task label");
        expect_true(spec.name.find('/') == std::string::npos, "runtime name sanitized: " + spec.name);

        CommandRequest req;
        req.command = "echo hi";
        auto r = mgr.exec(c.handle, req);
        expect_eq_ll(r.exit_code, 0, "exec exit");

        mgr.destroy(c.handle);
        expect_true(!mgr.is_live(c.handle), "gone after destroy");
        expect_eq_ll((long long)rt.live_environments(), 0, "environment removed");
        expect_eq_ll((long long)rt.count("stop:"), 1, "graceful stop first");

        mgr.destroy(c.handle);
        expect_eq_ll((long long)rt.count("remove:"), 1, "double destroy is a no-op");

        auto r2 = mgr.exec(c.handle, req);
        expect_eq_ll(r2.exit_code, -1, "exec after destroy");
        expect_true(r2.stderr_text == "Sandbox not found: " + c.handle, "not found text: " + r2.stderr_text);
    }

    // Test 2: missing image is pulled; unpullable image fails without a handle
    {
        FakeRuntime rt;
        rt.missing_images = {"python:3.11-slim", "nosuch/image:latest"};
        rt.unpullable = {"nosuch/image:latest"};
        SandboxManager mgr(rt, limits);

        auto ok = mgr.create(make_task("p", "python:3.11-slim"));
        expect_true(ok.ok(), "pulled image creates");
        expect_eq_ll((long long)rt.count("pull:python"), 1, "pulled once");

        auto bad = mgr.create(make_task("q", "nosuch/image:latest"));
        expect_true(!bad.ok(), "unpullable image fails");
        expect_true(bad.handle.empty(), "no handle on image failure");
        expect_true(bad.error->find("Image unavailable: nosuch/image:latest") == 0, "error: " + *bad.error);
        expect_eq_ll((long long)mgr.live_count(), 1, "only the good sandbox is tracked");
        mgr.destroy_all();
        expect_eq_ll((long long)mgr.live_count(), 0, "destroy_all");
    }

    // Test 3: create and start failures
    {
        FakeRuntime rt;
        rt.fail_create = true;
        SandboxManager mgr(rt, limits);
        auto c = mgr.create(make_task("a"));
        expect_true(!c.ok() && c.handle.empty(), "create failure has no handle");
        expect_true(c.error->find("Failed to create sandbox") == 0, "create error text");

        FakeRuntime rt2;
        rt2.fail_start = true;
        SandboxManager mgr2(rt2, limits);
        auto s = mgr2.create(make_task("b"));
        expect_true(!s.ok(), "start failure");
        expect_true(!s.handle.empty(), "handle returned so the caller can clean up");
        expect_true(s.error->find("Failed to start sandbox") == 0, "start error text");
        mgr2.destroy(s.handle);
        expect_eq_ll((long long)rt2.live_environments(), 0, "partial sandbox removed");
    }

    // Test 4: setup commands run in order; failures are tolerated
    {
        FakeRuntime rt;
        rt.on_exec = [](const std::string&, const CommandRequest& req, const CancelToken*) {
            CommandResult r;
            r.exit_code = req.command == "false" ? 1 : 0;
            return r;
        };
        SandboxManager mgr(rt, limits);
        Task t = make_task("s");
        t.setup_commands = {"mkdir -p /workspace/a", "false", "touch /workspace/a/b"};
        auto c = mgr.create(t);
        expect_true(c.ok(), "setup failure does not fail create");
        auto reqs = rt.exec_requests();
        expect_eq_ll((long long)reqs.size(), 3, "all setup commands ran");
        expect_true(reqs[0].command == "mkdir -p /workspace/a" && reqs[2].command == "touch /workspace/a/b",
                    "setup order");
    }

    // Test 4b: a throwing runtime during setup still hands back the handle
    {
        FakeRuntime rt;
        rt.on_exec = [](const std::string&, const CommandRequest&, const CancelToken*) -> CommandResult {
            throw std::runtime_error("exec transport lost");
        };
        SandboxManager mgr(rt, SandboxLimits{});
        Task t = make_task("throwing-setup");
        t.setup_commands = {"make deps"};
        SandboxCreateResult res;
        bool threw = false;
        try {
            res = mgr.create(t);
        } catch (const std::exception&) {
            threw = true;
        }
        expect_true(!threw, "create does not throw");
        expect_true(!res.ok(), "create reports the failure");
        expect_true(res.error.value_or("").find("exec transport lost") != std::string::npos, "cause kept");
        expect_true(!res.handle.empty() && mgr.is_live(res.handle), "handle returned for cleanup");
        mgr.destroy(res.handle);
        expect_eq_ll((long long)mgr.live_count(), 0, "destroyed");
        expect_eq_ll((long long)rt.live_environments(), 0, "environment removed");
    }

    // Test 5: stop failure still removes
    {
        FakeRuntime rt;
        rt.fail_stop = true;
        SandboxManager mgr(rt, limits);
        auto c = mgr.create(make_task("z"));
        mgr.destroy(c.handle);
        expect_eq_ll((long long)rt.live_environments(), 0, "forced removal after failed stop");
    }

    // Test 6: cancelled before create
    {
        FakeRuntime rt;
        SandboxManager mgr(rt, limits);
        CancelToken tok;
        tok.cancel();
        auto c = mgr.create(make_task("c"), &tok);
        expect_true(!c.ok() && *c.error == "Evaluation cancelled", "cancelled create");
        expect_eq_ll((long long)rt.count("create:"), 0, "nothing created");
    }

    // Test 7: concurrent create/destroy yields unique handles and no leaks
    {
        FakeRuntime rt;
        SandboxRegistry reg;
        SandboxManager mgr(rt, limits, &reg);
        std::vector<std::string> handles(16);
        std::vector<std::thread> th;
        for (int i = 0; i < 16; i++) {
            th.emplace_back([&, i]() {
                auto c = mgr.create(make_task("t" + std::to_string(i)));
                handles[(size_t)i] = c.handle;
                mgr.destroy(c.handle);
                mgr.destroy(c.handle);
            });
        }
        for (auto& t : th) t.join();
        std::sort(handles.begin(), handles.end());
        expect_true(std::unique(handles.begin(), handles.end()) == handles.end(), "handles unique");
        expect_eq_ll((long long)reg.size(), 0, "registry empty");
        expect_eq_ll((long long)rt.count("remove:"), 16, "each sandbox removed exactly once");
    }

    std::cerr << "test_sandbox_manager: ALL PASSED" << std::endl;
    return 0;
}
