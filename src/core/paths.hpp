#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Expand a leading "~" or "~/" to the user's home directory.
std::string expand_user(const std::string& path);

// Make one path absolute and lexically normal. Relative paths are joined
// onto base_dir, or onto the current directory when base_dir is empty.
// Returns "" for blank input.
std::string normalize_file_path(const std::string& path, const fs::path& base_dir = {});

// Normalize every entry, drop blanks and duplicates (first occurrence wins).
// Order of the surviving entries is preserved.
FileList normalize_file_paths(const FileList& paths, const fs::path& base_dir = {});

// Directory the receipt opens: parent of the first path. "" for an empty list.
std::string anchor_directory(const FileList& paths);
