#include "gauntlet/log.h"

#include "gauntlet/diag.h"
#include "gauntlet/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace gauntlet {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Recursively serialize JSON with object keys in sorted order.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_mini::Doc ks(json_mini::new_string(keys[i]));
            out << json_object_to_json_string_ext(ks.root, JSON_C_TO_STRING_PLAIN);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, (int)i), out);
        }
        out << "]";
        break;
    }
    default:
        // strings, numbers, booleans: json-c output is already canonical
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonicalize_json(const std::string& raw) {
    json_mini::Doc d = json_mini::parse(raw);
    if (!d) return raw;
    std::ostringstream out;
    canonical_serialize(d.root, out);
    return out.str();
}

JsonlLogger::JsonlLogger(const RunHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path) {
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    out_.open(path_, std::ios::out | std::ios::trunc);
    ok_ = out_.good();
    if (!ok_) log_warn("log", "cannot open event log " + path_ + ", events dropped");
}

void JsonlLogger::event(int step, const std::string& name, const std::string& payload_json) {
    json_mini::Doc rec(json_object_new_object());
    json_object_object_add(rec.root, "event", json_mini::new_string(name));

    json_mini::Doc payload = json_mini::parse(payload_json);
    json_object_object_add(rec.root, "payload",
                           payload ? payload.release() : json_mini::new_string(payload_json));

    json_object_object_add(rec.root, "run_id", json_mini::new_string(hdr_.run_id));
    if (!hdr_.dataset.empty())
        json_object_object_add(rec.root, "dataset", json_mini::new_string(hdr_.dataset));
    json_object_object_add(rec.root, "profile", json_mini::new_string(hdr_.profile));
    json_object_object_add(rec.root, "step", json_object_new_int(step));
    json_object_object_add(rec.root, "ts", json_mini::new_string(iso_now()));

    std::ostringstream line;
    canonical_serialize(rec.root, line);

    std::lock_guard<std::mutex> lk(mu_);
    if (!ok_) return;
    out_ << line.str() << "\n";
    out_.flush();
}

std::string gen_run_id() {
    const char* det = std::getenv("GAUNTLET_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception&) {
            r = 0x9e3779b97f4a7c15ULL;
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << a << b;
    return oss.str();
}

} // namespace gauntlet
