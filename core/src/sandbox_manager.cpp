#include "gauntlet/sandbox_manager.h"

#include "gauntlet/diag.h"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>

#ifndef _WIN32
  #include <unistd.h>
#endif

namespace gauntlet {

// --- SandboxRegistry ---

std::string SandboxRegistry::allocate() {
    std::lock_guard<std::mutex> lk(mu_);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "sbx-%06llu", (unsigned long long)++next_);
    return buf;
}

void SandboxRegistry::insert(const std::string& handle, SandboxEntry entry) {
    std::lock_guard<std::mutex> lk(mu_);
    entries_[handle] = std::move(entry);
}

std::optional<SandboxEntry> SandboxRegistry::lookup(const std::string& handle) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(handle);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::optional<SandboxEntry> SandboxRegistry::claim(const std::string& handle) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(handle);
    if (it == entries_.end()) return std::nullopt;
    SandboxEntry e = std::move(it->second);
    entries_.erase(it);
    return e;
}

bool SandboxRegistry::contains(const std::string& handle) const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.count(handle) > 0;
}

std::vector<std::string> SandboxRegistry::handles() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

size_t SandboxRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

// --- SandboxManager ---

namespace {

// Container names allow [a-zA-Z0-9_.-]; everything else becomes '-'.
std::string runtime_name(const std::string& task_id, const std::string& handle) {
    std::string safe;
    for (char c : task_id) {
        unsigned char u = (unsigned char)c;
        safe.push_back((std::isalnum(u) || c == '_' || c == '.' || c == '-') ? c : '-');
        if (safe.size() >= 40) break;
    }
#ifndef _WIN32
    long pid = (long)getpid();
#else
    long pid = 0;
#endif
    return "gauntlet-" + (safe.empty() ? std::string("task") : safe) + "-" +
           std::to_string(pid) + "-" + handle;
}

} // namespace

SandboxManager::SandboxManager(ISandboxRuntime& runtime,
                               SandboxLimits limits,
                               SandboxRegistry* registry,
                               int setup_timeout_sec)
    : runtime_(runtime),
      limits_(limits),
      owned_registry_(registry ? nullptr : std::make_unique<SandboxRegistry>()),
      registry_(registry ? registry : owned_registry_.get()),
      setup_timeout_sec_(setup_timeout_sec > 0 ? setup_timeout_sec : 300) {}

SandboxCreateResult SandboxManager::create(const Task& task, const CancelToken* cancel) {
    SandboxCreateResult res;

    if (cancel && cancel->cancelled()) {
        res.error = "Evaluation cancelled";
        return res;
    }

    if (!runtime_.image_present(task.image)) {
        log_info("sandbox", "pulling image " + task.image);
        RuntimeStatus pst = runtime_.pull_image(task.image, cancel);
        if (!pst.ok) {
            res.error = "Image unavailable: " + task.image + " (" + pst.error + ")";
            return res;
        }
    }

    const std::string handle = registry_->allocate();
    SandboxSpec spec;
    spec.name = runtime_name(task.task_id, handle);
    spec.image = task.image;
    spec.working_directory = task.working_directory;
    spec.environment = task.environment;
    spec.labels["gauntlet.task"] = task.task_id;
    spec.labels["gauntlet.handle"] = handle;
    spec.limits = limits_;

    std::string env_id;
    RuntimeStatus cst = runtime_.create_environment(spec, &env_id);
    if (!cst.ok) {
        res.error = "Failed to create sandbox: " + cst.error;
        return res;
    }

    // tracked from here on so every later failure can still be cleaned up
    registry_->insert(handle, SandboxEntry{env_id, task.task_id});
    res.handle = handle;

    try {
        RuntimeStatus sst = runtime_.start(env_id);
        if (!sst.ok) {
            res.error = "Failed to start sandbox: " + sst.error;
            return res;
        }

        for (size_t i = 0; i < task.setup_commands.size(); i++) {
            CommandRequest req;
            req.command = task.setup_commands[i];
            req.timeout_sec = setup_timeout_sec_;
            CommandResult r = runtime_.exec(env_id, req, cancel);
            if (cancel && cancel->cancelled()) {
                res.error = "Evaluation cancelled";
                return res;
            }
            if (r.exit_code != 0) {
                log_warn("sandbox", "setup command " + std::to_string(i + 1) + " for task " + task.task_id +
                         " exited " + std::to_string(r.exit_code) +
                         (r.timed_out ? " (timed out)" : "") +
                         (r.stderr_text.empty() ? "" : ": " + r.stderr_text));
            }
        }
    } catch (const std::exception& e) {
        res.error = std::string("Sandbox setup failed: ") + e.what();
        return res;
    }

    log_debug("sandbox", "created " + handle + " (" + env_id + ") for task " + task.task_id);
    return res;
}

CommandResult SandboxManager::exec(const std::string& handle,
                                   const CommandRequest& req,
                                   const CancelToken* cancel) {
    auto entry = registry_->lookup(handle);
    if (!entry) {
        CommandResult r;
        r.exit_code = -1;
        r.stderr_text = "Sandbox not found: " + handle;
        return r;
    }
    try {
        return runtime_.exec(entry->env_id, req, cancel);
    } catch (const std::exception& e) {
        CommandResult r;
        r.exit_code = -1;
        r.stderr_text = std::string("exec failed: ") + e.what();
        return r;
    }
}

void SandboxManager::destroy(const std::string& handle) {
    auto entry = registry_->claim(handle);
    if (!entry) return;

    try {
        RuntimeStatus st = runtime_.stop(entry->env_id, limits_.stop_grace_sec);
        if (!st.ok && !st.not_found) {
            log_warn("sandbox", "graceful stop of " + handle + " failed: " + st.error);
        }
    } catch (const std::exception& e) {
        log_warn("sandbox", "graceful stop of " + handle + " threw: " + e.what());
    }

    try {
        RuntimeStatus rst = runtime_.remove(entry->env_id, true);
        if (!rst.ok) {
            if (rst.not_found) log_debug("sandbox", handle + " already removed");
            else log_warn("sandbox", "forced removal of " + handle + " failed: " + rst.error);
        }
    } catch (const std::exception& e) {
        log_warn("sandbox", "forced removal of " + handle + " threw: " + e.what());
    }

    log_debug("sandbox", "destroyed " + handle + " (task " + entry->task_id + ")");
}

void SandboxManager::destroy_all() {
    for (const auto& h : registry_->handles()) destroy(h);
}

bool SandboxManager::is_live(const std::string& handle) const {
    return registry_->contains(handle);
}

size_t SandboxManager::live_count() const {
    return registry_->size();
}

} // namespace gauntlet
