#include "cmd_run.h"
#include "runner_utils.h"

#include "gauntlet/diag.h"
#include "gauntlet/report.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>

using namespace gauntlet;

static std::atomic<CancelToken*> g_run_cancel{nullptr};

static void on_stop_signal(int) {
    if (CancelToken* c = g_run_cancel.load()) c->cancel();
}

int cmd_run(int argc, char** argv) {
    EvalConfig cfg = load_config_with_profile();
    std::string report_path;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        std::string err;
        if (parse_eval_flag(argc, argv, i, cfg, &err)) {
            if (!err.empty()) { std::cerr << err << "\n"; return 2; }
            continue;
        }
        if (a == "--report" && i + 1 < argc) { report_path = argv[++i]; continue; }
        if (a == "-h" || a == "--help") {
            std::cerr << "usage: gauntlet_cli run [flags] [--report FILE]\n";
            print_eval_flags_usage(std::cerr);
            return 0;
        }
        std::cerr << "unknown argument: " << a << "\n";
        return 2;
    }

    auto stack = build_eval_stack(cfg);
    Evaluator& ev = *stack->evaluator;

    ::signal(SIGPIPE, SIG_IGN);
    g_run_cancel.store(&ev.cancel_token());
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);
    struct SignalGuard {
        ~SignalGuard() {
            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            g_run_cancel.store(nullptr);
        }
    } sg;

    log_info("runner", "evaluating dataset '" + cfg.dataset + "' against " + cfg.participant_url);

    AggregateMetrics m;
    try {
        m = ev.run();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] evaluation failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << format_summary(m) << "\n";

    if (!report_path.empty()) {
        std::string werr = write_report_file(report_path, snapshot_to_json(m));
        if (!werr.empty()) {
            std::cerr << "[ERROR] report: " << werr << "\n";
            return 1;
        }
        std::cerr << "[runner] report written to " << report_path << "\n";
    }

    if (ev.status() == RunStatus::CANCELLED) {
        std::cerr << "[WARN] evaluation cancelled; " << m.total_tasks << " task result(s) recorded\n";
        return 130;
    }
    return 0;
}

int cmd_tasks(int argc, char** argv) {
    EvalConfig cfg = load_config_with_profile();
    for (int i = 2; i < argc; i++) {
        std::string err;
        if (parse_eval_flag(argc, argv, i, cfg, &err)) {
            if (!err.empty()) { std::cerr << err << "\n"; return 2; }
            continue;
        }
        std::cerr << "unknown argument: " << argv[i] << "\n";
        return 2;
    }

    auto source = make_task_source(cfg.dataset, cfg.dataset_dir);
    std::vector<Task> tasks;
    try {
        tasks = source->load();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    std::cout << tasks.size() << " task(s) from " << source->describe() << "\n";
    for (const auto& t : tasks) {
        std::cout << "  " << t.task_id << "  [" << t.image << "]";
        if (!t.tags.empty()) {
            std::cout << "  tags=";
            bool first = true;
            for (const auto& tag : t.tags) {
                if (!first) std::cout << ",";
                std::cout << tag;
                first = false;
            }
        }
        std::cout << "\n    " << t.instruction << "\n";
    }
    return 0;
}
