#pragma once

#include "gauntlet/types.h"

#include <memory>
#include <string>
#include <vector>

namespace gauntlet {

// Ordered, read-only task list. load() throws std::runtime_error when the
// dataset cannot be read; that aborts the run.
class ITaskSource {
public:
    virtual ~ITaskSource() = default;
    virtual std::vector<Task> load() = 0;
    virtual std::string describe() const = 0;
};

// JSON file: either a top-level array of tasks or {"tasks": [...]}.
class JsonFileTaskSource : public ITaskSource {
public:
    explicit JsonFileTaskSource(std::string path) : path_(std::move(path)) {}
    std::vector<Task> load() override;
    std::string describe() const override { return "file:" + path_; }

private:
    std::string path_;
};

// Three small file-system tasks used when no dataset file is available.
class BuiltinTaskSource : public ITaskSource {
public:
    std::vector<Task> load() override;
    std::string describe() const override { return "builtin"; }
};

// Fixed in-memory list (tests, embedding).
class StaticTaskSource : public ITaskSource {
public:
    explicit StaticTaskSource(std::vector<Task> tasks) : tasks_(std::move(tasks)) {}
    std::vector<Task> load() override { return tasks_; }
    std::string describe() const override { return "static"; }

private:
    std::vector<Task> tasks_;
};

// Parse a dataset document. Throws std::runtime_error naming the bad entry.
std::vector<Task> parse_tasks_json(const std::string& json, const std::string& origin);

// dataset names an existing file -> that file; <dataset_dir>/<dataset>.json
// exists -> that file; otherwise the built-in samples (with a warning).
std::unique_ptr<ITaskSource> make_task_source(const std::string& dataset,
                                              const std::string& dataset_dir);

const Task* find_task(const std::vector<Task>& tasks, const std::string& task_id);

} // namespace gauntlet
