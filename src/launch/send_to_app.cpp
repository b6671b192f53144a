#include "send_to_app.hpp"
#include <core/log.hpp>
#include <core/paths.hpp>
#include <fmt/format.h>

AppSender::AppSender(SingleInstanceClient& client, Launcher& launcher)
    : client_(client), launcher_(launcher) {}

Result<void> AppSender::send_files_to_app(const FileList& files,
                                          const AppEntry& app,
                                          const std::string& base_directory) {
    if (app.path.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument,
                                 fmt::format("app '{}' has no path configured", app.name));
    }

    FileList resolved = normalize_file_paths(files, base_directory);
    if (resolved.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "no files to send");
    }

    if (app.has_app_id()) {
        if (client_.send_file_list_to_running_app(*app.app_id, resolved)) {
            return Result<void>::Ok();
        }
        log_info("send", fmt::format("'{}' not running; launching {}", *app.app_id, app.path));
    }

    auto launched = launcher_.start_detached(app.path, resolved);
    if (launched.is_err()) {
        return Result<void>::Err(ErrorCode::LaunchFailed,
                                 fmt::format("could not open files with {}: {}",
                                             app.name.empty() ? app.path : app.name,
                                             launched.error));
    }
    return Result<void>::Ok();
}
