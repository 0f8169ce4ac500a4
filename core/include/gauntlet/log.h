#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace gauntlet {

struct RunHeader {
    std::string run_id;
    std::string dataset;
    std::string profile{"dev"};
};

// Structured run log: one canonical (sorted-key) JSON object per line,
// {"event","payload","run_id","dataset","profile","step","ts"}.
// Safe to share between evaluator workers.
class JsonlLogger {
public:
    JsonlLogger(const RunHeader& hdr, const std::string& path);

    // payload_json that does not parse is stored as a JSON string.
    void event(int step, const std::string& name, const std::string& payload_json);

    bool ok() const { return ok_; }
    const std::string& path() const { return path_; }
    const RunHeader& header() const { return hdr_; }

private:
    RunHeader hdr_;
    std::string path_;
    std::mutex mu_;
    std::ofstream out_;
    bool ok_{false};
};

// Sorted-key serialization of an arbitrary JSON text; returns the input
// unchanged if it does not parse.
std::string canonicalize_json(const std::string& raw);

// Random hex id; GAUNTLET_DETERMINISTIC_RUN_ID=1 pins the seed.
std::string gen_run_id();

} // namespace gauntlet
