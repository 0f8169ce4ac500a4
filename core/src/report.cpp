#include "gauntlet/report.h"

#include "gauntlet/json_mini.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gauntlet {

namespace {

std::string fixed(double v, int prec) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", prec, v);
    return buf;
}

} // namespace

json_object* result_to_json(const EvaluationResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "task_id", json_mini::new_string(r.task_id));
    json_object_object_add(o, "passed", json_object_new_boolean(r.passed ? 1 : 0));
    json_object_object_add(o, "reward", json_object_new_double(r.reward));
    json_object_object_add(o, "turns", json_object_new_int(r.turns));
    json_object_object_add(o, "total_time", json_object_new_double(r.total_time_sec));
    json_object_object_add(o, "error", r.error ? json_mini::new_string(*r.error) : nullptr);
    json_object_object_add(o, "status", json_object_new_string(task_status_name(r.status)));
    json_object_object_add(o, "final_state", json_object_new_string(eval_state_name(r.final_state)));
    return o;
}

std::string snapshot_to_json(const AggregateMetrics& m) {
    json_mini::Doc root(json_object_new_object());
    json_object_object_add(root.root, "dataset", json_mini::new_string(m.dataset));
    json_object_object_add(root.root, "total_tasks", json_object_new_int64((int64_t)m.total_tasks));
    json_object_object_add(root.root, "passed", json_object_new_int64((int64_t)m.passed));
    json_object_object_add(root.root, "failed", json_object_new_int64((int64_t)m.failed));
    json_object_object_add(root.root, "pass_rate", json_object_new_double(m.pass_rate));
    json_object_object_add(root.root, "avg_turns", json_object_new_double(m.avg_turns));
    json_object_object_add(root.root, "avg_time", json_object_new_double(m.avg_time_sec));
    json_object_object_add(root.root, "total_reward", json_object_new_double(m.total_reward));

    json_object* arr = json_object_new_array();
    for (const auto& r : m.results) json_object_array_add(arr, result_to_json(r));
    json_object_object_add(root.root, "results", arr);

    return json_object_to_json_string_ext(root.root, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED);
}

std::string format_results_markdown(const AggregateMetrics& m) {
    std::ostringstream out;
    out << "# Gauntlet Evaluation Results\n"
        << "\n"
        << "Dataset: " << (m.dataset.empty() ? "unknown" : m.dataset) << "\n"
        << "Total Tasks: " << m.total_tasks << "\n"
        << "Passed: " << m.passed << "\n"
        << "Failed: " << m.failed << "\n"
        << "Pass Rate: " << fixed(m.pass_rate * 100.0, 1) << "%\n"
        << "Avg Turns: " << fixed(m.avg_turns, 1) << "\n"
        << "Avg Time: " << fixed(m.avg_time_sec, 1) << "s\n"
        << "\n"
        << "## Task Details\n"
        << "\n";
    for (const auto& r : m.results) {
        out << "- [" << (r.passed ? "\xE2\x9C\x93" : "\xE2\x9C\x97") << "] " << r.task_id << ": "
            << r.turns << " turns, " << fixed(r.total_time_sec, 1) << "s\n";
        if (r.error && !r.error->empty()) out << "  Error: " << *r.error << "\n";
    }
    std::string s = out.str();
    if (!s.empty() && s.back() == '\n') s.pop_back();
    return s;
}

std::string format_summary(const AggregateMetrics& m) {
    const std::string rule(50, '=');
    std::ostringstream out;
    out << rule << "\n"
        << "Gauntlet Evaluation Summary\n"
        << rule << "\n"
        << "Dataset: " << m.dataset << "\n"
        << "Total Tasks: " << m.total_tasks << "\n"
        << "Passed: " << m.passed << "\n"
        << "Failed: " << m.failed << "\n"
        << "Pass Rate: " << fixed(m.pass_rate * 100.0, 1) << "%\n"
        << "Average Turns: " << fixed(m.avg_turns, 1) << "\n"
        << "Average Time: " << fixed(m.avg_time_sec, 1) << "s\n"
        << "Total Reward: " << fixed(m.total_reward, 1) << "\n"
        << rule;
    return out.str();
}

std::string write_report_file(const std::string& dst, const std::string& body) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path p(dst);
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream f(tmp.string(), std::ios::binary | std::ios::trunc);
        if (!f) return "cannot write " + tmp.string();
        f << body;
        f.flush();
        if (!f) return "short write to " + tmp.string();
    }
    fs::rename(tmp, p, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove(tmp, ec2);
        return "rename to " + dst + " failed: " + ec.message();
    }
    return "";
}

} // namespace gauntlet
