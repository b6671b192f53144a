#include "launcher.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

Result<void> DetachedLauncher::start_detached(const std::string& executable_path,
                                              const FileList& files) {
    if (executable_path.empty()) {
        return Result<void>::Err(ErrorCode::LaunchFailed, "application path is empty");
    }

#ifdef __APPLE__
    std::string bundle = platform::resolve_app_path(executable_path);
    std::vector<std::string> args = {"-a", bundle};
    args.insert(args.end(), files.begin(), files.end());
    auto r = platform::spawn_detached("open", args);
    std::string shown = fmt::format("open -a {}", bundle);
#else
    auto r = platform::spawn_detached(executable_path, files);
    const std::string& shown = executable_path;
#endif

    if (r.is_err()) {
        log_error("launcher", fmt::format("launch failed: {}: {}", shown, r.error));
        return r;
    }
    log_info("launcher", fmt::format("launched {} with {} file(s)", shown, files.size()));
    return r;
}
