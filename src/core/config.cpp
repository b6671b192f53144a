#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

// Reads YAML nodes into a Config, tolerating absent keys.
class ConfigBuilder {
public:
    static Config build(const YAML::Node& root) {
        Config c;
        if (!root || !root.IsMap()) return c;

        std::string app_id = trimmed(root["app_id"].as<std::string>(""));
        if (!app_id.empty()) c.app_id_ = app_id;

        std::string registry = root["registry_dir"].as<std::string>("");
        if (!registry.empty()) c.registry_dir_ = registry;

        std::string runtime = root["runtime_dir"].as<std::string>("");
        if (!runtime.empty()) c.runtime_dir_ = runtime;

        const YAML::Node ipc = root["ipc"];
        if (ipc && ipc.IsMap()) {
            c.ipc_.connect_timeout_ms = positive_or(ipc["connect_timeout_ms"], c.ipc_.connect_timeout_ms);
            c.ipc_.write_timeout_ms = positive_or(ipc["write_timeout_ms"], c.ipc_.write_timeout_ms);
            c.ipc_.read_timeout_ms = positive_or(ipc["read_timeout_ms"], c.ipc_.read_timeout_ms);
            c.ipc_.probe_timeout_ms = positive_or(ipc["probe_timeout_ms"], c.ipc_.probe_timeout_ms);
        }

        const YAML::Node log = root["log"];
        if (log && log.IsMap()) {
            c.log_.file = log["file"].as<std::string>("");
            c.log_.level = log["level"].as<std::string>("");
        }
        return c;
    }

private:
    static int positive_or(const YAML::Node& node, int fallback) {
        if (!node || !node.IsScalar()) return fallback;
        int v = node.as<int>(fallback);
        return v > 0 ? v : fallback;
    }
};

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".handoff";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return Result<Config>::Ok(ConfigBuilder::build(YAML::Load(yaml_text)));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorCode::ConfigLoadFailed,
                                   fmt::format("invalid config: {}", e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    fs::path config_path = path.empty() ? get_config_path() : path;

    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        return Result<Config>::Ok(Config{});
    }

    try {
        return Result<Config>::Ok(ConfigBuilder::build(YAML::LoadFile(config_path.string())));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorCode::ConfigLoadFailed,
                                   fmt::format("{}: {}", config_path.string(), e.what()));
    }
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# handoff configuration

# Identity this host listens under. Senders use the same id in extern_app.json.
app_id: "handoff"

# Directory holding extern_app.json (default: beside the executable)
# registry_dir: ""

# Directory for the local socket (default: $XDG_RUNTIME_DIR, else temp)
# runtime_dir: ""

ipc:
  connect_timeout_ms: 3000
  write_timeout_ms: 2000
  read_timeout_ms: 2000
  probe_timeout_ms: 300

log:
  # file: "/tmp/handoff_debug.log"
  level: "info"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}
