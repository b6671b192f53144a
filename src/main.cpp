#include <iostream>
#include <vector>
#include <string>
#include "cli/handoff_cli.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/log.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    handoff "
              << theme::color::RESET << theme::color::SAND << "[files...]"
              << theme::color::RESET << theme::color::DIM
              << "          Receive files (first instance) or forward them" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    handoff "
              << theme::color::RESET << theme::color::SAND << "<files...> "
              << theme::color::RESET << theme::color::TEAL << "--send "
              << theme::color::RESET << theme::color::SAND << "<name>"
              << theme::color::RESET << theme::color::DIM
              << "  Open files in an external app" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    handoff --apps"
              << theme::color::RESET << theme::color::DIM
              << "                List configured external apps" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --app-id <id>         Instance identity (default: handoff)\n"
              << "    --config-dir <dir>    Directory holding extern_app.json\n"
              << "    --init-config         Write ~/.handoff/config.yaml\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

static void apply_log_settings(const Config& config) {
    if (!config.log().file.empty()) set_log_file(config.log().file);
    if (!config.log().level.empty()) set_log_level(parse_log_level(config.log().level));
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

        auto parsed = parse_cli_options(args);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            print_usage();
            return 1;
        }
        const CliOptions& opts = parsed.value;

        if (opts.show_version) {
            std::cout << theme::color::TEAL << theme::color::BOLD << "handoff"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << HANDOFF_VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (opts.show_help) {
            print_usage();
            return 0;
        }

        Config config;
        auto loaded = Config::load();
        if (loaded.is_ok()) {
            config = loaded.value;
            apply_log_settings(config);
        } else {
            log_warn("config", fmt::format("{}: {}; using defaults",
                                           error_code_name(loaded.code), loaded.error));
        }
        if (opts.app_id) config.set_app_id(*opts.app_id);
        if (opts.config_dir) config.set_registry_dir(*opts.config_dir);

        log_info("main", fmt::format("handoff {} started, app_id={}, {} file(s)",
                                     HANDOFF_VERSION, config.app_id(), opts.files.size()));

        HandoffCLI cli(config);

        if (opts.init_config) {
            return cli.run_init_config();
        }
        if (opts.list_apps) {
            return cli.run_list_apps();
        }
        if (opts.send_to) {
            if (opts.files.empty()) {
                std::cout << theme::fail("Nothing to send.");
                std::cout << theme::step("Usage: handoff <files...> --send <name>");
                return 1;
            }
            return cli.run_send(*opts.send_to, opts.files);
        }
        return cli.run_receiver(opts.files);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
