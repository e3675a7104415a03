// === include/Logger.hpp ===
#pragma once
#include <string>

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error };

// Desc: configure level and optional append-only log file ("" = none)
void logger_init(LogLevel min_level, const std::string& file_path);
void logger_set_level(LogLevel min_level);
LogLevel logger_level();

bool parse_log_level(const std::string& s, LogLevel& out);
// Reads INTEGRITY_LOG; returns fallback when unset or unparsable
LogLevel log_level_from_env(LogLevel fallback);

void log_line(LogLevel level, const std::string& tag, const std::string& msg);

inline void log_trace(const std::string& tag, const std::string& msg) { log_line(LogLevel::Trace, tag, msg); }
inline void log_debug(const std::string& tag, const std::string& msg) { log_line(LogLevel::Debug, tag, msg); }
inline void log_info (const std::string& tag, const std::string& msg) { log_line(LogLevel::Info,  tag, msg); }
inline void log_warn (const std::string& tag, const std::string& msg) { log_line(LogLevel::Warn,  tag, msg); }
inline void log_error(const std::string& tag, const std::string& msg) { log_line(LogLevel::Error, tag, msg); }
