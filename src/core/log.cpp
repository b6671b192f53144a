#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_path_ref() {
    static std::string path = [] {
        const char* env = std::getenv("HANDOFF_LOG_FILE");
        if (env) {
            std::string p = env;
            trim(p);
            if (!p.empty()) return p;
        }
        return (platform::temp_dir() / "handoff_debug.log").string();
    }();
    return path;
}

LogLevel& level_ref() {
    static LogLevel level = [] {
        const char* env = std::getenv("HANDOFF_LOG_LEVEL");
        return env ? parse_log_level(env) : LogLevel::Debug;
    }();
    return level;
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

LogLevel parse_log_level(const std::string& text, LogLevel fallback) {
    std::string s = text;
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return fallback;
}

std::string handoff_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_ref();
}

void set_log_file(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_ref() = path;
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex());
    level_ref() = level;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return level_ref();
}

void handoff_log(LogLevel level, const std::string& component, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    if (static_cast<int>(level) < static_cast<int>(level_ref())) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {} {}: {}",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()),
                                   level_tag(level), component, msg);

    std::ofstream out(log_path_ref(), std::ios::app);
    if (out) out << line << "\n";

    if (level >= LogLevel::Warn) {
        std::cerr << line << "\n";
    }
}
