/**
 * @file Log.cpp
 * @brief Implementation of leveled diagnostics
 */

#include "graft/Log.hpp"
#include "graft/Util.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace graft {

namespace {
    std::atomic<LogLevel> g_level{LogLevel::Warn};
    std::ostream* g_stream = nullptr;
    std::mutex g_mutex;
}

LogLevel parse_log_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "error") return LogLevel::Error;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    throw std::invalid_argument("Unknown log level: " + name +
                                " (expected error, warn, info or debug)");
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "unknown";
}

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

void set_log_stream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_stream = stream;
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(g_level.load());
}

void log(LogLevel level, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_stream ? *g_stream : std::cerr;
    out << "[" << to_upper(to_string(level)) << "] " << message << "\n";
}

} // namespace graft
