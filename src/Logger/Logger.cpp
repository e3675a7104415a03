// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <unistd.h>

#define COLOR_YELLOW "\033[1;33m"
#define COLOR_RED    "\033[1;31m"
#define COLOR_RESET  "\033[0m"

namespace {
    std::mutex  g_log_mtx;
    LogLevel    g_min_level = LogLevel::Info;
    std::string g_file_path;
}

static const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

void logger_init(LogLevel min_level, const std::string& file_path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_min_level = min_level;
    g_file_path = file_path;
}

void logger_set_level(LogLevel min_level) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_min_level = min_level;
}

LogLevel logger_level() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_min_level;
}

// Desc: parse level name (case-insensitive)
// In: const std::string& s, LogLevel& out
// Out: bool (false if unknown name)
bool parse_log_level(const std::string& s, LogLevel& out) {
    std::string l = s;
    for (char& c : l) c = (char)std::tolower((unsigned char)c);
    if (l == "trace")                   { out = LogLevel::Trace; return true; }
    if (l == "debug")                   { out = LogLevel::Debug; return true; }
    if (l == "info")                    { out = LogLevel::Info;  return true; }
    if (l == "warn" || l == "warning")  { out = LogLevel::Warn;  return true; }
    if (l == "error")                   { out = LogLevel::Error; return true; }
    return false;
}

LogLevel log_level_from_env(LogLevel fallback) {
    const char* env = std::getenv("INTEGRITY_LOG");
    if (!env) return fallback;
    LogLevel lvl = fallback;
    if (!parse_log_level(env, lvl)) return fallback;
    return lvl;
}

// Desc: append a timestamped line to the log file
// In: const std::string& path, const std::string& msg
// Out: void
static void file_append(const std::string& path, const std::string& msg) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    std::string line = "[" + std::string(buf) + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}

// Desc: emit one log line to stdout/stderr and the optional log file
// In: LogLevel level, const std::string& tag, const std::string& msg
// Out: void
void log_line(LogLevel level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (level < g_min_level) return;

    const std::string line = std::string("[") + level_name(level) + "][" + tag + "] " + msg;
    if (level >= LogLevel::Warn) {
        const bool tty = ::isatty(STDERR_FILENO) == 1;
        if (tty) std::cerr << (level == LogLevel::Error ? COLOR_RED : COLOR_YELLOW);
        std::cerr << line;
        if (tty) std::cerr << COLOR_RESET;
        std::cerr << "\n";
    } else {
        std::cout << line << "\n";
    }

    if (!g_file_path.empty()) file_append(g_file_path, line);
}
