#include "single_instance_server.hpp"
#include "wire_protocol.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <exception>
#include <utility>

Result<std::unique_ptr<SingleInstanceServer>> SingleInstanceServer::create(
    LocalTransport& transport,
    const std::string& app_id,
    FilesCallback on_files_received,
    ServerOptions options) {
    using R = Result<std::unique_ptr<SingleInstanceServer>>;

    if (app_id.empty()) {
        return R::Err(ErrorCode::InvalidArgument, "app_id is empty");
    }
    if (!on_files_received) {
        return R::Err(ErrorCode::InvalidArgument, "no file handler registered");
    }

    std::string endpoint = transport.endpoint_for(app_id);
    auto claimed = transport.listen(endpoint);
    if (claimed.is_err()) {
        if (claimed.code == ErrorCode::ClaimFailed) {
            log_info("server", fmt::format("not first instance for '{}': {}",
                                           app_id, claimed.error));
        } else {
            log_warn("server", fmt::format("listen failed for '{}': {}",
                                           app_id, claimed.error));
        }
        return R::Err(claimed.code, claimed.error);
    }

    std::unique_ptr<SingleInstanceServer> server(new SingleInstanceServer(
        app_id, std::move(claimed.value), std::move(on_files_received), options));
    log_info("server", fmt::format("listening; app_id={} endpoint={}",
                                   app_id, server->endpoint_name()));
    return R::Ok(std::move(server));
}

SingleInstanceServer::SingleInstanceServer(std::string app_id,
                                           std::unique_ptr<LocalListener> listener,
                                           FilesCallback on_files_received,
                                           ServerOptions options)
    : app_id_(std::move(app_id)),
      endpoint_(listener->endpoint()),
      listener_(std::move(listener)),
      on_files_received_(std::move(on_files_received)),
      options_(options) {
    thread_ = std::thread(&SingleInstanceServer::accept_loop, this);
}

SingleInstanceServer::~SingleInstanceServer() {
    stop();
}

void SingleInstanceServer::stop() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();
    if (listener_) {
        listener_.reset();
        log_info("server", fmt::format("stopped; app_id={} delivered={} dropped={}",
                                       app_id_, delivered_.load(), dropped_.load()));
    }
}

void SingleInstanceServer::accept_loop() {
    while (!stop_.load()) {
        // Short accept timeout so stop() is honoured promptly
        auto conn = listener_->accept(options_.accept_poll_ms);
        if (!conn) continue;
        handle_connection(*conn);
        // conn closes here; one message per connection
    }
}

void SingleInstanceServer::handle_connection(LocalStream& conn) {
    auto line = conn.receive_line(options_.max_message_bytes, options_.read_timeout_ms);
    if (line.is_err()) {
        dropped_++;
        log_warn("server", fmt::format("dropping connection ({}): {}",
                                       error_code_name(line.code), line.error));
        return;
    }

    auto files = decode_file_list(line.value);
    if (files.is_err()) {
        dropped_++;
        log_warn("server", fmt::format("malformed message dropped: {} ({} bytes)",
                                       files.error, line.value.size()));
        return;
    }

    if (files.value.empty()) {
        log_debug("server", "empty file list ignored");
        return;
    }

    log_info("server", fmt::format("received {} file(s) on {}", files.value.size(), endpoint_));
    try {
        on_files_received_(files.value);
        delivered_++;
    } catch (const std::exception& e) {
        dropped_++;
        log_error("server", fmt::format("file handler threw: {}", e.what()));
    } catch (...) {
        dropped_++;
        log_error("server", "file handler threw a non-standard exception");
    }
}
