#pragma once

#include "gauntlet/types.h"

#include <json-c/json.h>

#include <string>

namespace gauntlet {

// New json-c object (caller owns the reference):
// {task_id, passed, reward, turns, total_time, error, status, final_state}
json_object* result_to_json(const EvaluationResult& r);

// Aggregate report: {dataset, total_tasks, passed, failed, pass_rate,
// avg_turns, avg_time, total_reward, results:[...]}
std::string snapshot_to_json(const AggregateMetrics& m);

// Markdown block returned to whoever asked for the evaluation.
std::string format_results_markdown(const AggregateMetrics& m);

// Boxed plain-text summary for the terminal.
std::string format_summary(const AggregateMetrics& m);

// Write body to dst via a temp file and rename. Returns "" on success,
// otherwise the error.
std::string write_report_file(const std::string& dst, const std::string& body);

} // namespace gauntlet
