#include "gauntlet/diag.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>

namespace gauntlet {

namespace {

std::atomic<int> g_threshold{-1};
std::mutex g_out_mu;

const char* level_tag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

} // namespace

LogLevel parse_log_level(const std::string& s, LogLevel defv) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return defv;
}

LogLevel log_threshold() {
    int t = g_threshold.load();
    if (t < 0) {
        LogLevel lvl = LogLevel::INFO;
        if (const char* e = std::getenv("GAUNTLET_LOG_LEVEL")) lvl = parse_log_level(e);
        t = static_cast<int>(lvl);
        g_threshold.store(t);
    }
    return static_cast<LogLevel>(t);
}

void set_log_threshold(LogLevel lvl) {
    g_threshold.store(static_cast<int>(lvl));
}

void log_line(LogLevel lvl, const std::string& component, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(log_threshold())) return;
    std::ostringstream oss;
    oss << "[" << level_tag(lvl) << "] [" << component << "] " << msg << "\n";
    // one write per line so concurrent workers don't interleave mid-line
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cerr << oss.str();
}

} // namespace gauntlet
