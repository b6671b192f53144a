#pragma once

#include <string>
#include <core/types.hpp>

// Cold-launch side of the hand-off: start a fresh process of the target
// application with the file list as its launch arguments.
class Launcher {
public:
    virtual ~Launcher() = default;

    // LaunchFailed when the target cannot be started.
    virtual Result<void> start_detached(const std::string& executable_path,
                                        const FileList& files) = 0;
};

// Platform launcher.
//   Unix:    <executable> <file>...
//   macOS:   open -a <bundle> <file>...   (bundle via resolve_app_path)
//   Windows: CreateProcess, detached, each argument quoted
class DetachedLauncher : public Launcher {
public:
    Result<void> start_detached(const std::string& executable_path,
                                const FileList& files) override;
};
