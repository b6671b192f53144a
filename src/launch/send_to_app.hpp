#pragma once

#include <string>
#include <core/types.hpp>
#include <ipc/single_instance_client.hpp>
#include "launcher.hpp"

// "Open in external app": hot-send to a running instance when the entry has
// an app_id, otherwise (or when nobody is listening) cold-launch the target.
class AppSender {
public:
    AppSender(SingleInstanceClient& client, Launcher& launcher);

    // Relative paths are resolved against base_directory (or the current
    // directory). Only total failure is reported: hot-send unavailable and
    // the launch failing too (LaunchFailed). Empty path / no files is
    // InvalidArgument.
    Result<void> send_files_to_app(const FileList& files,
                                   const AppEntry& app,
                                   const std::string& base_directory = "");

private:
    SingleInstanceClient& client_;
    Launcher& launcher_;
};
