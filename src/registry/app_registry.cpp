#include "app_registry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

using json = nlohmann::json;

static std::string string_field(const json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

fs::path AppRegistry::config_path(const fs::path& config_dir) {
    fs::path base = config_dir.empty() ? platform::executable_dir() : config_dir;
    return base / REGISTRY_FILENAME;
}

std::vector<AppEntry> AppRegistry::load(const fs::path& config_dir) {
    std::vector<AppEntry> apps;
    fs::path path = config_path(config_dir);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        log_debug("registry", fmt::format("no registry at {}", path.string()));
        return apps;
    }

    std::ifstream in(path);
    json root = json::parse(in, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        log_warn("registry", fmt::format("{}: {} is not a JSON object; using no apps",
                                         error_code_name(ErrorCode::ConfigLoadFailed),
                                         path.string()));
        return apps;
    }

    auto list = root.find("apps");
    if (list == root.end() || !list->is_array()) {
        log_warn("registry", fmt::format("{}: {} has no \"apps\" array",
                                         error_code_name(ErrorCode::ConfigLoadFailed),
                                         path.string()));
        return apps;
    }

    for (const auto& item : *list) {
        if (!item.is_object()) continue;
        AppEntry entry;
        entry.name = string_field(item, "name");
        entry.path = string_field(item, "path");

        // "send_to_app_id" is the older spelling of the same key
        for (const char* key : {"app_id", "send_to_app_id"}) {
            std::string id = trimmed(string_field(item, key));
            if (!id.empty()) {
                entry.app_id = id;
                break;
            }
        }
        apps.push_back(std::move(entry));
    }

    log_debug("registry", fmt::format("loaded {} app(s) from {}", apps.size(), path.string()));
    return apps;
}

Result<void> AppRegistry::save(const fs::path& config_dir, const std::vector<AppEntry>& apps) {
    fs::path path = config_path(config_dir);

    json list = json::array();
    for (const auto& app : apps) {
        json item = {{"name", app.name}, {"path", app.path}};
        if (app.has_app_id()) item["app_id"] = *app.app_id;
        list.push_back(std::move(item));
    }
    json root = {{"apps", std::move(list)}};

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Result<void>::Err(ErrorCode::IoError,
                                 "Failed to open registry for writing: " + path.string());
    }
    out << root.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out) {
        return Result<void>::Err(ErrorCode::IoError,
                                 "Failed to write registry: " + path.string());
    }
    return Result<void>::Ok();
}

std::optional<AppEntry> AppRegistry::find(const std::vector<AppEntry>& apps,
                                          const std::string& name) {
    for (const auto& app : apps) {
        if (app.name == name) return app;
    }
    return std::nullopt;
}
