#include "test_common.h"
#include "gauntlet/json_mini.h"
#include "gauntlet/log.h"
#include "gauntlet/report.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace gauntlet;

static AggregateMetrics sample() {
    AggregateMetrics m;
    m.dataset = "terminal-bench-core";
    EvaluationResult a;
    a.task_id = "sample-001";
    a.passed = true;
    a.reward = 1.0;
    a.turns = 2;
    a.total_time_sec = 3.25;
    a.status = TaskStatus::PASSED;
    EvaluationResult b;
    b.task_id = "sample-002";
    b.turns = 0;
    b.total_time_sec = 0.5;
    b.error = "Image unavailable: python:3.11-slim (pull failed)";
    b.status = TaskStatus::PROVISION_ERROR;
    b.final_state = EvalState::ERRORED;
    m.results = {a, b};
    m.total_tasks = 2;
    m.passed = 1;
    m.failed = 1;
    m.pass_rate = 0.5;
    m.avg_turns = 1.0;
    m.avg_time_sec = 1.875;
    m.total_reward = 1.0;
    return m;
}

int main() {
    // Test 1: markdown
    {
        std::string md = format_results_markdown(sample());
        expect_true(md.find("# Gauntlet Evaluation Results\n") == 0, "header");
        expect_true(md.find("Pass Rate: 50.0%") != std::string::npos, "pass rate");
        expect_true(md.find("## Task Details") != std::string::npos, "details section");
        expect_true(md.find("- [\xE2\x9C\x93] sample-001: 2 turns, 3.2s") != std::string::npos ||
                    md.find("- [\xE2\x9C\x93] sample-001: 2 turns, 3.3s") != std::string::npos, "pass line: " + md);
        expect_true(md.find("- [\xE2\x9C\x97] sample-002: 0 turns, 0.5s\n  Error: Image unavailable") != std::string::npos,
                    "fail line with error");
        expect_true(md.back() != '\n', "no trailing newline");
    }

    // Test 2: terminal summary
    {
        std::string s = format_summary(sample());
        const std::string rule(50, '=');
        expect_true(s.find(rule + "\nGauntlet Evaluation Summary\n" + rule) == 0, "boxed title");
        expect_true(s.find("Total Tasks: 2") != std::string::npos, "total");
        expect_true(s.find("Average Time: 1.9s") != std::string::npos, "avg time rounded");
        expect_true(s.find("Total Reward: 1.0") != std::string::npos, "reward");
        expect_true(s.size() >= rule.size() && s.compare(s.size() - rule.size(), rule.size(), rule) == 0,
                    "closing rule");
    }

    // Test 3: JSON report
    {
        json_mini::Doc d = json_mini::parse(snapshot_to_json(sample()));
        expect_true((bool)d, "report parses");
        expect_eq_ll(json_mini::member_int(d.root, "total_tasks").value_or(-1), 2, "total_tasks");
        expect_true(json_mini::member_double(d.root, "pass_rate").value_or(0) == 0.5, "pass_rate");
        json_object* results = json_mini::member(d.root, "results");
        expect_eq_ll((long long)json_object_array_length(results), 2, "results");
        json_object* first = json_object_array_get_idx(results, 0);
        json_object* second = json_object_array_get_idx(results, 1);
        expect_true(json_object_object_get_ex(first, "error", nullptr), "error key present");
        expect_true(!json_mini::member(first, "error"), "error null on pass");
        expect_true(json_mini::member_string(first, "status").value_or("") == "PASSED", "status name");
        expect_true(json_mini::member_string(second, "final_state").value_or("") == "errored", "final state");
        expect_true(json_mini::member_double(first, "total_time").value_or(0) == 3.25, "total_time");
    }

    // Test 4: write_report_file and event log
    {
        namespace fs = std::filesystem;
        fs::path dir = fs::temp_directory_path() / ("gauntlet_rep_" + std::to_string((long)getpid()));
        fs::path dst = dir / "nested" / "report.json";
        expect_true(write_report_file(dst.string(), "{\"x\":1}").empty(), "report written");
        std::ifstream in(dst.string());
        std::stringstream ss;
        ss << in.rdbuf();
        expect_true(ss.str() == "{\"x\":1}", "report content");
        expect_true(!fs::exists(dst.string() + ".tmp"), "temp file gone");

        RunHeader hdr;
        hdr.run_id = "rid";
        hdr.dataset = "ds";
        {
            JsonlLogger log(hdr, (dir / "events.jsonl").string());
            log.event(1, "turn", "{\"b\":2,\"a\":1}");
            log.event(2, "note", "not json");
        }
        std::ifstream ev((dir / "events.jsonl").string());
        std::string l1, l2;
        std::getline(ev, l1);
        std::getline(ev, l2);
        expect_true(l1.find("{\"dataset\":\"ds\",\"event\":\"turn\",\"payload\":{\"a\":1,\"b\":2},") == 0,
                    "sorted keys: " + l1);
        expect_true(l1.find("\"step\":1") != std::string::npos, "step");
        expect_true(l2.find("\"payload\":\"not json\"") != std::string::npos, "raw payload kept as string");

        expect_true(canonicalize_json("{\"z\":[{\"b\":1,\"a\":2}]}") == "{\"z\":[{\"a\":2,\"b\":1}]}", "canonical");
        expect_true(canonicalize_json("nope") == "nope", "non-JSON unchanged");

        setenv("GAUNTLET_DETERMINISTIC_RUN_ID", "1", 1);
        expect_true(gen_run_id() == gen_run_id(), "deterministic run id");
        unsetenv("GAUNTLET_DETERMINISTIC_RUN_ID");
        expect_true(gen_run_id() != gen_run_id(), "random run ids differ");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::cerr << "test_report: ALL PASSED" << std::endl;
    return 0;
}
