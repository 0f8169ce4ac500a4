#pragma once

// Gauntlet sandbox manager: one sandbox per task, tracked by handle.
//
// The manager owns the mapping from opaque handles ("sbx-000001") to runtime
// environment ids. The registry is synchronized so several evaluator workers
// can create, exec and destroy concurrently; claim() hands an entry to
// exactly one destroyer, so double destroy is a no-op.

#include "gauntlet/cancel.h"
#include "gauntlet/config.h"
#include "gauntlet/sandbox_runtime.h"
#include "gauntlet/types.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gauntlet {

struct SandboxEntry {
    std::string env_id;
    std::string task_id;
};

class SandboxRegistry {
public:
    // Next unused handle. Handles are never reused.
    std::string allocate();

    void insert(const std::string& handle, SandboxEntry entry);
    std::optional<SandboxEntry> lookup(const std::string& handle) const;

    // Remove and return the entry; only the first caller gets it.
    std::optional<SandboxEntry> claim(const std::string& handle);

    bool contains(const std::string& handle) const;
    std::vector<std::string> handles() const;
    size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, SandboxEntry> entries_;
    uint64_t next_{0};
};

struct SandboxCreateResult {
    std::string handle;                // empty when nothing was created
    std::optional<std::string> error;  // set on any failure

    bool ok() const { return !error.has_value(); }
};

class SandboxManager {
public:
    // registry == nullptr: the manager owns a private registry.
    SandboxManager(ISandboxRuntime& runtime,
                   SandboxLimits limits,
                   SandboxRegistry* registry = nullptr,
                   int setup_timeout_sec = 300);

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    // Pull the image if absent, create and start the environment, run the
    // task's setup commands in order. A handle created before a failure is
    // returned alongside the error so the caller can destroy it.
    SandboxCreateResult create(const Task& task, const CancelToken* cancel = nullptr);

    // Never throws. Unknown handle: exit_code -1 with a descriptive stderr.
    CommandResult exec(const std::string& handle,
                       const CommandRequest& req,
                       const CancelToken* cancel = nullptr);

    // Idempotent; stop with grace period, then forced removal. Never throws.
    void destroy(const std::string& handle);
    void destroy_all();

    bool is_live(const std::string& handle) const;
    size_t live_count() const;

    SandboxRegistry& registry() { return *registry_; }
    const SandboxLimits& limits() const { return limits_; }

private:
    ISandboxRuntime& runtime_;
    SandboxLimits limits_;
    std::unique_ptr<SandboxRegistry> owned_registry_;
    SandboxRegistry* registry_;
    int setup_timeout_sec_;
};

} // namespace gauntlet
