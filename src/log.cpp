// =============================================================================
// log.cpp - Logger Implementation
// =============================================================================

#include "vusd/log.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace vusd {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::ostream* g_sink = nullptr;
std::mutex g_sink_mutex;

std::string now_to_string() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

const char* base_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // anonymous namespace

void Logger::set_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() {
    return g_level.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level) {
    return level >= g_level.load(std::memory_order_relaxed);
}

void Logger::set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = sink;
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (!enabled(level)) return;

    std::ostringstream oss;
    oss << now_to_string() << " [" << level_name(level) << "]"
        << " (" << std::this_thread::get_id() << ") "
        << base_name(file) << ":" << line << " - " << message << '\n';

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::ostream& out = g_sink ? *g_sink : std::clog;
    out << oss.str();
    out.flush();
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNK";
}

std::optional<LogLevel> Logger::parse_level(std::string_view name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

} // namespace vusd
