#pragma once

#include "gauntlet/config.h"
#include "gauntlet/evaluator.h"
#include "gauntlet/log.h"
#include "gauntlet/messenger.h"
#include "gauntlet/metrics.h"
#include "gauntlet/sandbox_manager.h"
#include "gauntlet/sandbox_runtime.h"
#include "gauntlet/task_source.h"

#include <iosfwd>
#include <memory>
#include <string>

namespace gauntlet {

// ---- Flag parsing shared by run / serve / tasks ----

// If argv[i] is one of the evaluation flags, consume it (and its value),
// apply it to cfg and return true. Returns false for flags it does not know.
// A known flag with a missing or invalid value sets *err.
bool parse_eval_flag(int argc, char** argv, int& i, EvalConfig& cfg, std::string* err);

// Parse a decimal int in [lo, hi].
bool parse_int_in_range(const std::string& s, int lo, int hi, int* out);

void print_eval_flags_usage(std::ostream& os);

// ---- Wiring ----

// Everything one evaluator needs, owned together. Members are declared in
// dependency order so the evaluator goes first on destruction.
struct EvalStack {
    EvalConfig cfg;
    RunHeader header;
    std::unique_ptr<ITaskSource> tasks;
    std::unique_ptr<DockerCliRuntime> runtime;
    std::unique_ptr<SandboxManager> sandboxes;
    std::unique_ptr<A2AMessenger> messenger;
    std::unique_ptr<MetricsAggregator> metrics;
    std::unique_ptr<JsonlLogger> events;
    std::unique_ptr<Evaluator> evaluator;
};

std::unique_ptr<EvalStack> build_eval_stack(const EvalConfig& cfg);

// Profile defaults, then GAUNTLET_* env. Call before any thread starts.
EvalConfig load_config_with_profile();

} // namespace gauntlet
