#include "gauntlet/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace gauntlet {

Profile detect_profile() {
    const char* env = std::getenv("GAUNTLET_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must run before worker threads start: setenv() races with getenv().
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("GAUNTLET_LOG_LEVEL",        "debug", NO_OVERWRITE);
            setenv("GAUNTLET_MAX_TURNS",        "50",    NO_OVERWRITE);
            setenv("GAUNTLET_TASK_TIMEOUT_SEC", "600",   NO_OVERWRITE);
            setenv("GAUNTLET_EVENT_LOG",        "1",     NO_OVERWRITE);
            setenv("GAUNTLET_WORKERS",          "1",     NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("GAUNTLET_LOG_LEVEL",        "info",  NO_OVERWRITE);
            setenv("GAUNTLET_MAX_TURNS",        "50",    NO_OVERWRITE);
            setenv("GAUNTLET_TASK_TIMEOUT_SEC", "600",   NO_OVERWRITE);
            setenv("GAUNTLET_EVENT_LOG",        "1",     NO_OVERWRITE);
            setenv("GAUNTLET_WORKERS",          "1",     NO_OVERWRITE);
            // serve: reject unauthenticated evaluation requests
            setenv("GAUNTLET_API_REQUIRE_TOKEN", "1",    NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* name, int defv) {
    if (const char* v = std::getenv(name)) {
        try { return std::stoi(v); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

std::string getenv_str(const char* name, const std::string& defv) {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    return v;
}

EvalConfig load_eval_config() {
    EvalConfig c;
    c.dataset = getenv_str("GAUNTLET_DATASET", c.dataset);
    c.dataset_dir = getenv_str("GAUNTLET_DATASET_DIR", c.dataset_dir);
    c.participant_url = getenv_str("GAUNTLET_PARTICIPANT_URL", c.participant_url);
    c.max_turns = std::max(1, getenv_int("GAUNTLET_MAX_TURNS", c.max_turns));
    c.task_timeout_sec = std::max(1, getenv_int("GAUNTLET_TASK_TIMEOUT_SEC", c.task_timeout_sec));
    c.command_timeout_sec = std::max(1, getenv_int("GAUNTLET_COMMAND_TIMEOUT_SEC", c.command_timeout_sec));
    c.verify_timeout_sec = std::max(1, getenv_int("GAUNTLET_VERIFY_TIMEOUT_SEC", c.verify_timeout_sec));
    c.messenger_timeout_sec = std::max(1, getenv_int("GAUNTLET_MESSENGER_TIMEOUT_SEC", c.messenger_timeout_sec));
    c.workers = std::clamp(getenv_int("GAUNTLET_WORKERS", c.workers), 1, 64);
    c.docker_bin = getenv_str("GAUNTLET_DOCKER_BIN", c.docker_bin);
    c.log_dir = getenv_str("GAUNTLET_LOG_DIR", c.log_dir);
    c.event_log = getenv_int("GAUNTLET_EVENT_LOG", 1) != 0;

    c.limits.memory_mb = std::max(16, getenv_int("GAUNTLET_SANDBOX_MEMORY_MB", c.limits.memory_mb));
    c.limits.cpu_percent = std::clamp(getenv_int("GAUNTLET_SANDBOX_CPU_PERCENT", c.limits.cpu_percent), 1, 100);
    c.limits.stop_grace_sec = std::clamp(getenv_int("GAUNTLET_SANDBOX_STOP_GRACE_SEC", c.limits.stop_grace_sec), 0, 60);
    return c;
}

} // namespace gauntlet
