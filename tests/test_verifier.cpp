#include "test_common.h"
#include "fakes.h"
#include "gauntlet/verifier.h"

using namespace gauntlet;
using gauntlet_test::FakeRuntime;

int main() {
    FakeRuntime rt;
    rt.on_exec = [](const std::string&, const CommandRequest& req, const CancelToken*) {
        CommandResult r;
        if (req.command == "check-ok") {
            r.exit_code = 0;
            r.stdout_text = "fine\n";
        } else if (req.command == "check-quiet-fail") {
            r.exit_code = 2;
        } else {
            r.exit_code = 1;
            r.stderr_text = "hello.txt missing";
        }
        return r;
    };
    SandboxManager mgr(rt, SandboxLimits{});

    Task t;
    t.task_id = "v1";
    t.instruction = "x";
    t.test_script = "check-ok";
    t.working_directory = "/srv";
    t.expected_reward = 3.0;
    auto c = mgr.create(t);
    expect_true(c.ok(), "sandbox");

    Verifier v(mgr, 42);
    expect_eq_ll(v.timeout_sec(), 42, "timeout kept");

    // Test 1: pass carries the task's reward, runs in its workdir with the verify timeout
    {
        auto out = v.verify(c.handle, t);
        expect_true(out.passed, "passed");
        expect_true(out.reward == 3.0, "reward = expected_reward");
        expect_true(!out.error, "no error on pass");
        expect_true(out.stdout_text == "fine\n", "stdout kept");
        auto reqs = rt.exec_requests();
        expect_true(reqs.back().workdir.value_or("") == "/srv", "script runs in task workdir");
        expect_eq_ll(reqs.back().timeout_sec, 42, "verification timeout");
    }

    // Test 2: failure, error is the script's stderr
    {
        Task f = t;
        f.test_script = "check-fail";
        auto out = v.verify(c.handle, f);
        expect_true(!out.passed && out.reward == 0.0, "failed, zero reward");
        expect_eq_ll(out.exit_code, 1, "exit code");
        expect_true(out.error.value_or("") == "hello.txt missing", "error from stderr");
    }

    // Test 3: custom script
    {
        auto out = v.run_custom(c.handle, "check-quiet-fail");
        expect_true(!out.passed, "custom fail");
        expect_eq_ll(out.exit_code, 2, "custom exit code");
        expect_true(out.error && out.error->empty(), "empty stderr kept as empty error");
        expect_true(rt.exec_requests().back().workdir.value_or("") == "/workspace", "default workdir");
    }

    // Test 4: destroyed sandbox cannot pass
    {
        mgr.destroy(c.handle);
        auto out = v.verify(c.handle, t);
        expect_true(!out.passed && out.exit_code == -1, "missing sandbox fails verification");
    }

    std::cerr << "test_verifier: ALL PASSED" << std::endl;
    return 0;
}
