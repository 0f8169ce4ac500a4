#pragma once
#include <string>

namespace gauntlet {

// Leveled diagnostics on stderr: "[WARN] [sandbox] message".
// Threshold comes from GAUNTLET_LOG_LEVEL (debug|info|warn|error), read once.
enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

LogLevel log_threshold();
void set_log_threshold(LogLevel lvl);
LogLevel parse_log_level(const std::string& s, LogLevel defv = LogLevel::INFO);

void log_line(LogLevel lvl, const std::string& component, const std::string& msg);

inline void log_debug(const std::string& c, const std::string& m) { log_line(LogLevel::DEBUG, c, m); }
inline void log_info(const std::string& c, const std::string& m)  { log_line(LogLevel::INFO, c, m); }
inline void log_warn(const std::string& c, const std::string& m)  { log_line(LogLevel::WARN, c, m); }
inline void log_error(const std::string& c, const std::string& m) { log_line(LogLevel::ERROR, c, m); }

} // namespace gauntlet
