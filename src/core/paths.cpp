#include "paths.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <system_error>
#include <unordered_set>

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() == 1) return platform::home_dir().string();
    if (path[1] != '/' && path[1] != '\\') return path;  // ~user is left alone
    return (platform::home_dir() / path.substr(2)).string();
}

std::string normalize_file_path(const std::string& path, const fs::path& base_dir) {
    std::string text = trimmed(path);
    if (text.empty()) return "";

    fs::path p(expand_user(text));
    if (!p.is_absolute()) {
        fs::path base = base_dir;
        if (base.empty()) {
            std::error_code ec;
            base = fs::current_path(ec);
            if (ec) base = fs::path();
        }
        p = base / p;
    }

    p = p.lexically_normal();
    // lexically_normal keeps a trailing separator ("/a/b/"); drop it
    std::string out = p.string();
    while (out.size() > 1 && (out.back() == '/' || out.back() == '\\') &&
           p.has_relative_path()) {
        out.pop_back();
        p = fs::path(out);
    }
    return out;
}

FileList normalize_file_paths(const FileList& paths, const fs::path& base_dir) {
    FileList normalized;
    std::unordered_set<std::string> seen;
    for (const auto& raw : paths) {
        std::string full = normalize_file_path(raw, base_dir);
        if (full.empty()) continue;
        if (!seen.insert(full).second) continue;
        normalized.push_back(std::move(full));
    }
    return normalized;
}

std::string anchor_directory(const FileList& paths) {
    if (paths.empty()) return "";
    fs::path first(paths.front());
    fs::path parent = first.parent_path();
    return parent.empty() ? first.string() : parent.string();
}
