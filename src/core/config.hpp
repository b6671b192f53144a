#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct IpcSettings {
    int connect_timeout_ms = CONNECT_TIMEOUT_MS;
    int write_timeout_ms = WRITE_TIMEOUT_MS;
    int read_timeout_ms = READ_TIMEOUT_MS;
    int probe_timeout_ms = PROBE_TIMEOUT_MS;
};

struct LogSettings {
    std::string file;     // empty = keep default / HANDOFF_LOG_FILE
    std::string level;    // empty = keep default / HANDOFF_LOG_LEVEL
};

class Config {
public:
    // Load ~/.handoff/config.yaml (or the given file). A missing file is not
    // an error and yields defaults; an unreadable or malformed file is
    // ConfigLoadFailed.
    static Result<Config> load(const fs::path& path = {});

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::string& app_id() const { return app_id_; }
    const fs::path& registry_dir() const { return registry_dir_; }
    const fs::path& runtime_dir() const { return runtime_dir_; }
    const IpcSettings& ipc() const { return ipc_; }
    const LogSettings& log() const { return log_; }

    void set_app_id(const std::string& id) { app_id_ = id; }
    void set_registry_dir(const fs::path& dir) { registry_dir_ = dir; }

public:
    Config() = default;

private:
    std::string app_id_ = DEFAULT_APP_ID;
    fs::path registry_dir_;    // empty = executable directory
    fs::path runtime_dir_;     // empty = platform default
    IpcSettings ipc_;
    LogSettings log_;

    friend class ConfigBuilder;
};

// Helper to check if the config exists
bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create default config (never overwrites)
Result<void> create_default_config();
