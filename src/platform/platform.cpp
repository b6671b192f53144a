#include "platform.hpp"
#include <cstdint>
#include <cstdlib>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/types.h>
#endif

#ifdef __APPLE__
#  include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

fs::path runtime_dir() {
#ifndef _WIN32
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) {
        std::error_code ec;
        if (fs::is_directory(xdg, ec)) return fs::path(xdg);
    }
#endif
    return temp_dir();
}

fs::path executable_dir() {
    std::error_code ec;
#ifdef _WIN32
    std::vector<wchar_t> buf(MAX_PATH);
    for (;;) {
        DWORD n = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (n == 0) break;
        if (n < buf.size()) return fs::path(std::wstring(buf.data(), n)).parent_path();
        buf.resize(buf.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buf(size + 1, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) == 0) {
        fs::path p = fs::weakly_canonical(fs::path(buf.data()), ec);
        if (!ec) return p.parent_path();
    }
#else
    fs::path p = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return p.parent_path();
#endif
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

std::string user_token() {
#ifdef _WIN32
    const char* user = std::getenv("USERNAME");
    std::string token = user ? user : "";
    auto start = token.find_first_not_of(" \t");
    if (start == std::string::npos) return "default";
    token.erase(0, start);
    token.erase(token.find_last_not_of(" \t") + 1);
    return token;
#else
    return std::to_string(static_cast<unsigned long>(getuid()));
#endif
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
