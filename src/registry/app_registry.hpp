#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// extern_app.json: {"apps": [{"name": ..., "path": ..., "app_id": ...}, ...]}
// Lives beside the host executable unless a directory is given.
class AppRegistry {
public:
    // <config_dir>/extern_app.json; empty config_dir = executable directory
    static fs::path config_path(const fs::path& config_dir = {});

    // Never fails: a missing or malformed file yields an empty list.
    static std::vector<AppEntry> load(const fs::path& config_dir = {});

    static Result<void> save(const fs::path& config_dir, const std::vector<AppEntry>& apps);

    // First entry whose name matches exactly.
    static std::optional<AppEntry> find(const std::vector<AppEntry>& apps,
                                        const std::string& name);
};
