#pragma once

#include <string>
#include <vector>
#include <optional>
#include <ostream>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <receive/receipt_dispatcher.hpp>

namespace fs = std::filesystem;

// handoff [files...] [--app-id <id>] [--send <name>] [--apps]
//         [--config-dir <dir>] [--init-config] [--version] [--help]
struct CliOptions {
    FileList files;                          // leading path arguments
    std::optional<std::string> app_id;
    std::optional<std::string> send_to;
    std::optional<fs::path> config_dir;
    bool list_apps = false;
    bool init_config = false;
    bool show_help = false;
    bool show_version = false;
};

Result<CliOptions> parse_cli_options(const std::vector<std::string>& args);

// Receiving surface of the command-line host: prints each receipt.
class TerminalListing : public FileListingCollaborator {
public:
    explicit TerminalListing(std::ostream& out);
    void open_directory_then_select(const std::string& directory,
                                    const FileList& paths_to_select) override;

private:
    std::ostream& out_;
};

// Composition root. Owns the transport, the server claim, the adapter and
// the dispatcher for the lifetime of the process.
class HandoffCLI {
public:
    explicit HandoffCLI(Config config);

    // First instance: claim the endpoint and print receipts until
    // interrupted. Not first: forward `files` to the running instance.
    int run_receiver(const FileList& files);

    // Two-tier hand-off of `files` to the registry entry `app_name`.
    int run_send(const std::string& app_name, const FileList& files);

    // Print extern_app.json entries.
    int run_list_apps();

    // Write ~/.handoff/config.yaml unless one exists.
    int run_init_config();

private:
    Config config_;
};
