#include "coord/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace coord {

namespace {

std::atomic<int> g_level{(int)LogLevel::Warn};
std::mutex g_log_mu;

const char* level_tag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

} // namespace

void set_log_level(LogLevel lvl) {
    g_level.store((int)lvl, std::memory_order_relaxed);
}

LogLevel log_level() {
    return (LogLevel)g_level.load(std::memory_order_relaxed);
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    if (s == "error") return LogLevel::Error;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "info") return LogLevel::Info;
    if (s == "debug") return LogLevel::Debug;
    return std::nullopt;
}

void log_line(LogLevel lvl, const std::string& msg) {
    if ((int)lvl > g_level.load(std::memory_order_relaxed)) return;
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[coord] " << level_tag(lvl) << " " << msg << "\n";
}

} // namespace coord
