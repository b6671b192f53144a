#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Per-user runtime directory for local endpoints: XDG_RUNTIME_DIR when set,
// otherwise the temp directory.
std::filesystem::path runtime_dir();

// Directory containing the running executable. Falls back to the current
// directory when the platform query fails.
std::filesystem::path executable_dir();

// Stable per-user token: numeric uid on Unix, USERNAME on Windows.
std::string user_token();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
