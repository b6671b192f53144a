#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Start a program detached from the caller: new session, stdio on the null
// device, no handle to wait on. Each arg is passed as a separate argument.
// Returns LaunchFailed when the program cannot be found or executed; on Unix
// exec failure is reported back through a close-on-exec pipe.
Result<void> spawn_detached(const std::string& program,
                            const std::vector<std::string>& args);

// Quote one argument for a Windows command line (MSVC argv rules).
std::string quote_windows_arg(const std::string& arg);

// Map a configured app path onto something "open -a" accepts:
//   "/Applications/X.app"         -> unchanged
//   "/Applications/X"             -> "/Applications/X.app" if that exists
//   "/Applications/Adobe X"       -> "/Applications/Adobe X/Adobe X.app",
//                                    else the first *.app inside the folder
//   anything else                 -> bare name without extension
std::string resolve_app_path(const std::string& app_path);

} // namespace platform
