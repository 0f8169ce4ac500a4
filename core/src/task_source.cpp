#include "gauntlet/task_source.h"

#include "gauntlet/diag.h"
#include "gauntlet/json_mini.h"

#include <json-c/json.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace gauntlet {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxDatasetBytes = 64ULL * 1024 * 1024;

std::string first_string(json_object* obj, const char* a, const char* b) {
    if (auto v = json_mini::member_string(obj, a)) return *v;
    if (auto v = json_mini::member_string(obj, b)) return *v;
    return {};
}

Task task_from_json(json_object* obj, size_t index, const std::string& origin) {
    const std::string where = origin + " task #" + std::to_string(index);
    if (!json_mini::is_object(obj)) throw std::runtime_error(where + ": not an object");

    Task t;
    t.task_id = first_string(obj, "task_id", "id");
    if (t.task_id.empty()) throw std::runtime_error(where + ": missing task_id");
    t.instruction = json_mini::member_string(obj, "instruction").value_or("");
    if (t.instruction.empty()) throw std::runtime_error(where + " (" + t.task_id + "): missing instruction");
    t.test_script = json_mini::member_string(obj, "test_script").value_or("");
    if (t.test_script.empty()) throw std::runtime_error(where + " (" + t.task_id + "): missing test_script");

    if (auto wd = json_mini::member_string(obj, "working_directory")) {
        if (!wd->empty()) t.working_directory = *wd;
    }
    std::string image = first_string(obj, "docker_image", "image");
    if (!image.empty()) t.image = image;
    t.environment = json_mini::member_string_map(obj, "environment");
    t.setup_commands = json_mini::member_strings(obj, "setup_commands");
    if (auto r = json_mini::member_double(obj, "expected_reward")) {
        if (*r > 0.0) t.expected_reward = *r;
    }
    for (auto& tag : json_mini::member_strings(obj, "tags")) t.tags.insert(tag);
    return t;
}

} // namespace

std::vector<Task> parse_tasks_json(const std::string& json, const std::string& origin) {
    json_mini::Doc d = json_mini::parse(json);
    if (!d) throw std::runtime_error(origin + ": invalid JSON");

    json_object* arr = d.root;
    if (json_mini::is_object(arr)) arr = json_mini::member(arr, "tasks");
    if (!arr || !json_object_is_type(arr, json_type_array)) {
        throw std::runtime_error(origin + ": expected a task array or {\"tasks\": [...]}");
    }

    std::vector<Task> out;
    std::set<std::string> seen;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        Task t = task_from_json(json_object_array_get_idx(arr, (int)i), i, origin);
        if (!seen.insert(t.task_id).second) {
            throw std::runtime_error(origin + ": duplicate task_id " + t.task_id);
        }
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<Task> JsonFileTaskSource::load() {
    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    if (ec) throw std::runtime_error("cannot read dataset " + path_ + ": " + ec.message());
    if (size > kMaxDatasetBytes) throw std::runtime_error("dataset " + path_ + " too large");

    std::ifstream in(path_, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open dataset " + path_);
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_tasks_json(ss.str(), path_);
}

std::vector<Task> BuiltinTaskSource::load() {
    std::vector<Task> out;

    Task a;
    a.task_id = "sample-001";
    a.instruction = "Create a file named 'hello.txt' containing the text 'Hello, World!'";
    a.test_script = "test -f /workspace/hello.txt && grep -q \"Hello, World!\" /workspace/hello.txt";
    a.tags = {"file-operations", "basic"};
    out.push_back(a);

    Task b;
    b.task_id = "sample-002";
    b.instruction = "Create a directory named 'mydir' and inside it create a file named 'data.json' "
                    "with valid JSON content: {\"key\": \"value\"}";
    b.test_script = "test -d /workspace/mydir && test -f /workspace/mydir/data.json && "
                    "python3 -c \"import json; json.load(open('/workspace/mydir/data.json'))\"";
    b.image = "python:3.11-slim";
    b.tags = {"file-operations", "json"};
    out.push_back(b);

    Task c;
    c.task_id = "sample-003";
    c.instruction = "Find all .txt files in /workspace and count how many there are. "
                    "Write the count to a file called 'count.txt'";
    c.test_script = "test -f /workspace/count.txt";
    c.setup_commands = {
        "mkdir -p /workspace/subdir",
        "touch /workspace/a.txt /workspace/b.txt /workspace/subdir/c.txt",
    };
    c.tags = {"file-operations", "find"};
    out.push_back(c);

    return out;
}

std::unique_ptr<ITaskSource> make_task_source(const std::string& dataset,
                                              const std::string& dataset_dir) {
    std::error_code ec;
    if (!dataset.empty() && fs::is_regular_file(dataset, ec)) {
        return std::make_unique<JsonFileTaskSource>(dataset);
    }
    if (!dataset.empty() && !dataset_dir.empty()) {
        fs::path p = fs::path(dataset_dir) / (dataset + ".json");
        if (fs::is_regular_file(p, ec)) {
            return std::make_unique<JsonFileTaskSource>(p.string());
        }
    }
    log_warn("tasks", "dataset '" + dataset + "' not found under '" + dataset_dir +
             "', using built-in sample tasks");
    return std::make_unique<BuiltinTaskSource>();
}

const Task* find_task(const std::vector<Task>& tasks, const std::string& task_id) {
    for (const auto& t : tasks) {
        if (t.task_id == task_id) return &t;
    }
    return nullptr;
}

} // namespace gauntlet
