#pragma once

#include <string>
#include <fmt/format.h>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Parse "debug" / "info" / "warn" / "warning" / "error". Unknown -> fallback.
LogLevel parse_log_level(const std::string& text, LogLevel fallback = LogLevel::Debug);

// Log file path. Defaults to <temp>/handoff_debug.log, or HANDOFF_LOG_FILE.
std::string handoff_log_path();

// Redirect the log (config file / tests). Empty path keeps the current one.
void set_log_file(const std::string& path);
void set_log_level(LogLevel level);
LogLevel log_level();

// Append a timestamped line. Warn and above are mirrored to stderr.
void handoff_log(LogLevel level, const std::string& component, const std::string& msg);

inline void log_debug(const std::string& component, const std::string& msg) {
    handoff_log(LogLevel::Debug, component, msg);
}

inline void log_info(const std::string& component, const std::string& msg) {
    handoff_log(LogLevel::Info, component, msg);
}

inline void log_warn(const std::string& component, const std::string& msg) {
    handoff_log(LogLevel::Warn, component, msg);
}

inline void log_error(const std::string& component, const std::string& msg) {
    handoff_log(LogLevel::Error, component, msg);
}
