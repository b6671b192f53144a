#include "process.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <fcntl.h>
#  include <cerrno>
#  include <cstring>
#endif

namespace fs = std::filesystem;

namespace platform {

// ── resolve_app_path ─────────────────────────────────────────

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string resolve_app_path(const std::string& app_path) {
    if (app_path.empty()) return "";
    if (ends_with(app_path, ".app")) return app_path;

    std::error_code ec;
    std::string candidate = app_path + ".app";
    if (fs::is_directory(candidate, ec)) return candidate;

    fs::path dir(app_path);
    if (fs::is_directory(dir, ec)) {
        fs::path inner = dir / (dir.filename().string() + ".app");
        if (fs::is_directory(inner, ec)) return inner.string();

        // First bundle in directory order, same as listing the folder
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (ends_with(it->path().filename().string(), ".app")) {
                return it->path().string();
            }
        }
    }
    return fs::path(app_path).stem().string();
}

// ── spawn_detached ───────────────────────────────────────────

std::string quote_windows_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }
    std::string out = "\"";
    std::size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            backslashes++;
            continue;
        }
        if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
        } else {
            out.append(backslashes, '\\');
        }
        backslashes = 0;
        out += c;
    }
    out.append(backslashes * 2, '\\');
    out += '"';
    return out;
}

#ifdef _WIN32

static std::wstring widen(const std::string& utf8) {
    if (utf8.empty()) return std::wstring();
    int n = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                                nullptr, 0);
    std::wstring out(static_cast<std::size_t>(n), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                        out.data(), n);
    return out;
}

Result<void> spawn_detached(const std::string& program,
                            const std::vector<std::string>& args) {
    if (program.empty()) {
        return Result<void>::Err(ErrorCode::LaunchFailed, "no program given");
    }

    std::string cmdline = quote_windows_arg(program);
    for (const auto& arg : args) {
        cmdline += " " + quote_windows_arg(arg);
    }
    std::wstring wide_cmd = widen(cmdline);
    std::wstring wide_program = widen(program);

    STARTUPINFOW si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessW(wide_program.c_str(), wide_cmd.data(), nullptr, nullptr, FALSE,
                        DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP |
                            CREATE_UNICODE_ENVIRONMENT,
                        nullptr, nullptr, &si, &pi)) {
        return Result<void>::Err(ErrorCode::LaunchFailed,
            fmt::format("CreateProcess({}) failed (error {})", program, GetLastError()));
    }
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return Result<void>::Ok();
}

#else // Unix

Result<void> spawn_detached(const std::string& program,
                            const std::vector<std::string>& args) {
    if (program.empty()) {
        return Result<void>::Err(ErrorCode::LaunchFailed, "no program given");
    }

    // Build argv before forking; the child only calls async-signal-safe functions
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int status_pipe[2];
    if (pipe(status_pipe) != 0) {
        return Result<void>::Err(ErrorCode::LaunchFailed,
            fmt::format("pipe() failed: {}", std::strerror(errno)));
    }
    fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        return Result<void>::Err(ErrorCode::LaunchFailed,
            fmt::format("fork() failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Intermediate child: new session, fork again so the target is
        // reparented to init and never becomes our zombie
        close(status_pipe[0]);
        setsid();
        pid_t grandchild = fork();
        if (grandchild < 0) {
            int err = errno;
            (void)!write(status_pipe[1], &err, sizeof(err));
            _exit(1);
        }
        if (grandchild > 0) _exit(0);

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        int err = errno;
        (void)!write(status_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(status_pipe[1]);
    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}

    // EOF without data: exec succeeded and closed the pipe
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        return Result<void>::Err(ErrorCode::LaunchFailed,
            fmt::format("cannot execute {}: {}", program, std::strerror(child_errno)));
    }
    return Result<void>::Ok();
}

#endif

} // namespace platform
