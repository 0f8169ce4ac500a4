#include "runner_utils.h"

#include "gauntlet/diag.h"

#include <filesystem>
#include <ostream>

namespace gauntlet {

bool parse_int_in_range(const std::string& s, int lo, int hi, int* out) {
    if (s.empty()) return false;
    size_t pos = 0;
    long v = 0;
    try {
        v = std::stol(s, &pos, 10);
    } catch (const std::exception&) {
        return false;
    }
    if (pos != s.size() || v < lo || v > hi) return false;
    if (out) *out = (int)v;
    return true;
}

bool parse_eval_flag(int argc, char** argv, int& i, EvalConfig& cfg, std::string* err) {
    const std::string a = argv[i];

    auto value = [&](std::string* v) {
        if (i + 1 >= argc) {
            if (err) *err = "missing value for " + a;
            return false;
        }
        *v = argv[++i];
        return true;
    };
    auto int_value = [&](int lo, int hi, int* out) {
        std::string v;
        if (!value(&v)) return false;
        if (!parse_int_in_range(v, lo, hi, out)) {
            if (err) *err = "invalid value for " + a + ": " + v;
            return false;
        }
        return true;
    };

    if (a == "--dataset") { (void)value(&cfg.dataset); return true; }
    if (a == "--dataset-dir") { (void)value(&cfg.dataset_dir); return true; }
    if (a == "--participant-url") { (void)value(&cfg.participant_url); return true; }
    if (a == "--log-dir") { (void)value(&cfg.log_dir); return true; }
    if (a == "--docker-bin") { (void)value(&cfg.docker_bin); return true; }
    if (a == "--max-turns") { (void)int_value(1, 10000, &cfg.max_turns); return true; }
    if (a == "--task-timeout") { (void)int_value(1, 7 * 24 * 3600, &cfg.task_timeout_sec); return true; }
    if (a == "--command-timeout") { (void)int_value(1, 24 * 3600, &cfg.command_timeout_sec); return true; }
    if (a == "--verify-timeout") { (void)int_value(1, 24 * 3600, &cfg.verify_timeout_sec); return true; }
    if (a == "--workers") { (void)int_value(1, 64, &cfg.workers); return true; }
    if (a == "--no-event-log") { cfg.event_log = false; return true; }
    return false;
}

void print_eval_flags_usage(std::ostream& os) {
    os << "  --dataset D            dataset name or path to a JSON task file\n"
       << "  --dataset-dir DIR      directory searched for <dataset>.json\n"
       << "  --participant-url U    participant A2A endpoint\n"
       << "  --max-turns N          turn limit per task\n"
       << "  --task-timeout S       wall-clock limit per task\n"
       << "  --command-timeout S    default per-command timeout\n"
       << "  --verify-timeout S     test script timeout\n"
       << "  --workers N            tasks evaluated in parallel\n"
       << "  --docker-bin B         container CLI (e.g. \"sudo docker\", podman)\n"
       << "  --log-dir DIR          event log directory\n"
       << "  --no-event-log         do not write the JSONL event log\n";
}

EvalConfig load_config_with_profile() {
    Profile p = detect_profile();
    apply_profile_defaults(p);
    set_log_threshold(parse_log_level(getenv_str("GAUNTLET_LOG_LEVEL", "info")));
    return load_eval_config();
}

std::unique_ptr<EvalStack> build_eval_stack(const EvalConfig& cfg) {
    auto s = std::make_unique<EvalStack>();
    s->cfg = cfg;
    s->header.run_id = gen_run_id();
    s->header.dataset = cfg.dataset;
    s->header.profile = profile_name(detect_profile());

    s->tasks = make_task_source(cfg.dataset, cfg.dataset_dir);
    s->runtime = std::make_unique<DockerCliRuntime>(cfg.docker_bin);
    s->sandboxes = std::make_unique<SandboxManager>(*s->runtime, cfg.limits);
    s->messenger = std::make_unique<A2AMessenger>(cfg.participant_url, cfg.messenger_timeout_sec,
                                                  HttpTransport{}, cfg.command_timeout_sec);
    s->metrics = std::make_unique<MetricsAggregator>(cfg.dataset);

    if (cfg.event_log) {
        auto path = std::filesystem::path(cfg.log_dir) / ("run_" + s->header.run_id + ".jsonl");
        s->events = std::make_unique<JsonlLogger>(s->header, path.string());
        log_info("runner", "event log: " + s->events->path());
    }

    s->evaluator = std::make_unique<Evaluator>(cfg, *s->tasks, *s->sandboxes, *s->messenger,
                                               *s->metrics, s->events.get());
    return s;
}

} // namespace gauntlet
