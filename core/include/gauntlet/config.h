#pragma once
#include <string>

namespace gauntlet {

enum class Profile { DEV, PROD };

// Detect profile from GAUNTLET_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: verbose logging, event log on
// PROD: info logging, event log on, serve requires an API token
void apply_profile_defaults(Profile p);

struct SandboxLimits {
    int memory_mb{512};
    int cpu_percent{50};
    bool network_isolated{true};
    int stop_grace_sec{5};
};

struct EvalConfig {
    std::string dataset{"terminal-bench-core"};
    std::string dataset_dir{"datasets"};
    std::string participant_url{"http://127.0.0.1:9010"};
    int max_turns{50};
    int task_timeout_sec{600};
    int command_timeout_sec{30};
    int verify_timeout_sec{60};
    int messenger_timeout_sec{60};
    int workers{1};
    std::string docker_bin{"docker"};
    std::string log_dir{"logs"};
    bool event_log{true};
    SandboxLimits limits;
};

// Build an EvalConfig from GAUNTLET_* env vars; unset or unparsable values
// keep their defaults. Out-of-range values are clamped.
EvalConfig load_eval_config();

int getenv_int(const char* name, int defv);
std::string getenv_str(const char* name, const std::string& defv);

} // namespace gauntlet
