#pragma once

#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "transport.hpp"

struct ServerOptions {
    int read_timeout_ms = READ_TIMEOUT_MS;
    int accept_poll_ms = ACCEPT_POLL_MS;
    std::size_t max_message_bytes = MAX_MESSAGE_BYTES;
};

// Sole listener for one app_id. Owning the object is owning the claim:
// destroying it stops the accept thread and releases the endpoint.
//
// Every connection carries one line; its decoded file list is handed to
// on_files_received from the server thread. The handler must marshal onto
// the thread that owns application state (ReceiptDispatcher does this).
class SingleInstanceServer {
public:
    // ClaimFailed when another live instance already serves app_id.
    static Result<std::unique_ptr<SingleInstanceServer>> create(
        LocalTransport& transport,
        const std::string& app_id,
        FilesCallback on_files_received,
        ServerOptions options = {});

    ~SingleInstanceServer();

    SingleInstanceServer(const SingleInstanceServer&) = delete;
    SingleInstanceServer& operator=(const SingleInstanceServer&) = delete;

    // Stop accepting and release the endpoint. Idempotent.
    void stop();

    const std::string& app_id() const { return app_id_; }
    const std::string& endpoint_name() const { return endpoint_; }

    // Connections that produced a delivery / were dropped.
    std::size_t delivered_count() const { return delivered_.load(); }
    std::size_t dropped_count() const { return dropped_.load(); }

private:
    SingleInstanceServer(std::string app_id,
                         std::unique_ptr<LocalListener> listener,
                         FilesCallback on_files_received,
                         ServerOptions options);

    void accept_loop();
    void handle_connection(LocalStream& conn);

    std::string app_id_;
    std::string endpoint_;
    std::unique_ptr<LocalListener> listener_;
    FilesCallback on_files_received_;
    ServerOptions options_;

    std::atomic<bool> stop_{false};
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> dropped_{0};
    std::thread thread_;
};
