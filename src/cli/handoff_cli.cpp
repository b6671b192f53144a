#include "handoff_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <ipc/single_instance_client.hpp>
#include <ipc/single_instance_server.hpp>
#include <ipc/transport.hpp>
#include <launch/launcher.hpp>
#include <launch/send_to_app.hpp>
#include <receive/cold_start.hpp>
#include <receive/platform_open_adapter.hpp>
#include <registry/app_registry.hpp>
#include <fmt/format.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <system_error>

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void on_interrupt(int) {
    g_interrupted.store(true);
}

TransportOptions transport_options(const Config& config) {
    TransportOptions t;
    t.runtime_dir = config.runtime_dir();
    t.probe_timeout_ms = config.ipc().probe_timeout_ms;
    return t;
}

ClientOptions client_options(const Config& config) {
    ClientOptions c;
    c.connect_timeout_ms = config.ipc().connect_timeout_ms;
    c.write_timeout_ms = config.ipc().write_timeout_ms;
    return c;
}

} // namespace

// ── Options ──────────────────────────────────────────────

Result<CliOptions> parse_cli_options(const std::vector<std::string>& args) {
    CliOptions opts;
    opts.files = parse_initial_file_list(args);

    auto value_of = [&](std::size_t& i) -> std::optional<std::string> {
        if (i + 1 >= args.size()) return std::nullopt;
        return args[++i];
    };

    for (std::size_t i = options_start(args); i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (arg == "--version") {
            opts.show_version = true;
        } else if (arg == "--apps") {
            opts.list_apps = true;
        } else if (arg == "--init-config") {
            opts.init_config = true;
        } else if (arg == "--app-id" || arg == "--send" || arg == "--config-dir") {
            auto v = value_of(i);
            if (!v || v->empty()) {
                return Result<CliOptions>::Err(ErrorCode::InvalidArgument,
                                               fmt::format("{} needs a value", arg));
            }
            if (arg == "--app-id") opts.app_id = *v;
            else if (arg == "--send") opts.send_to = *v;
            else opts.config_dir = fs::path(*v);
        } else {
            return Result<CliOptions>::Err(ErrorCode::InvalidArgument,
                                           "Unknown option: " + arg);
        }
    }
    return Result<CliOptions>::Ok(std::move(opts));
}

// ── TerminalListing ──────────────────────────────────────

TerminalListing::TerminalListing(std::ostream& out) : out_(out) {}

void TerminalListing::open_directory_then_select(const std::string& directory,
                                                 const FileList& paths_to_select) {
    out_ << theme::section(fmt::format("Received {} file(s)", paths_to_select.size()));
    out_ << theme::kv("directory", directory);
    for (const auto& path : paths_to_select) {
        out_ << theme::step(path);
    }
    out_.flush();
}

// ── HandoffCLI ───────────────────────────────────────────

HandoffCLI::HandoffCLI(Config config) : config_(std::move(config)) {}

int HandoffCLI::run_receiver(const FileList& files) {
    auto transport = make_local_transport(transport_options(config_));

    TerminalListing listing(std::cout);
    ReceiptDispatcher dispatcher(listing);

    PlatformOpenAdapter open_adapter;
    open_adapter.install(dispatcher.callback_for(ReceiptSource::PlatformOpen));

    ServerOptions server_opts;
    server_opts.read_timeout_ms = config_.ipc().read_timeout_ms;
    auto server = SingleInstanceServer::create(*transport, config_.app_id(),
                                               dispatcher.callback_for(ReceiptSource::Socket),
                                               server_opts);
    if (server.is_err()) {
        if (server.code == ErrorCode::ClaimFailed) {
            if (files.empty()) {
                std::cout << theme::info(fmt::format("'{}' is already running", config_.app_id()));
                return 0;
            }
            SingleInstanceClient client(*transport, client_options(config_));
            if (client.send_file_list_to_running_app(config_.app_id(), files)) {
                std::cout << theme::ok(fmt::format("Handed {} file(s) to the running instance",
                                                   files.size()));
                return 0;
            }
            std::cout << theme::fail("Running instance did not accept the files");
            return 1;
        }
        // Still usable for this launch's own files, just not reachable
        std::cout << theme::fail(fmt::format("Cannot listen as '{}': {}",
                                             config_.app_id(), server.error));
    }

    std::cout << theme::banner();
    if (server.is_ok()) {
        std::cout << theme::kv("app id", config_.app_id());
        std::cout << theme::kv("endpoint", server.value->endpoint_name());
    }
    std::cout << theme::kv("log", handoff_log_path());

    if (!files.empty()) {
        dispatcher.on_files_received(files, ReceiptSource::ColdStart);
    }
    // The listing exists from here on; early open events can go through
    open_adapter.mark_ready();

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    while (!g_interrupted.load()) {
        open_adapter.flush_pending();
        dispatcher.wait_and_drain(DISPATCH_WAIT_MS);
    }
    dispatcher.drain();

    std::cout << "\n" << theme::info("Shutting down");
    return 0;
}

int HandoffCLI::run_send(const std::string& app_name, const FileList& files) {
    auto apps = AppRegistry::load(config_.registry_dir());
    auto app = AppRegistry::find(apps, app_name);
    if (!app) {
        std::cout << theme::fail(fmt::format("No app named '{}' in {}", app_name,
                                             AppRegistry::config_path(config_.registry_dir()).string()));
        return 1;
    }

    auto transport = make_local_transport(transport_options(config_));
    SingleInstanceClient client(*transport, client_options(config_));
    DetachedLauncher launcher;
    AppSender sender(client, launcher);

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    auto r = sender.send_files_to_app(files, *app, ec ? std::string() : cwd.string());
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Sent {} file(s) to {}", files.size(), app->name));
    return 0;
}

int HandoffCLI::run_list_apps() {
    auto path = AppRegistry::config_path(config_.registry_dir());
    auto apps = AppRegistry::load(config_.registry_dir());

    std::cout << theme::section("External apps");
    std::cout << theme::kv("registry", path.string());
    if (apps.empty()) {
        std::cout << theme::info("No apps configured");
        return 0;
    }
    for (const auto& app : apps) {
        std::string id = app.has_app_id() ? *app.app_id : theme::dim("launch only");
        std::cout << theme::step(fmt::format("{}  {}  {}", theme::bold(app.name), app.path, id));
    }
    return 0;
}

int HandoffCLI::run_init_config() {
    if (config_exists()) {
        std::cout << theme::info("Config already exists: " + get_config_path().string());
        return 0;
    }
    auto r = create_default_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + get_config_path().string());
    return 0;
}
