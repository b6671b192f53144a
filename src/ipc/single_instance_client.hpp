#pragma once

#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "transport.hpp"

struct ClientOptions {
    int connect_timeout_ms = CONNECT_TIMEOUT_MS;
    int write_timeout_ms = WRITE_TIMEOUT_MS;
};

// Hot-send side of the hand-off. Every call is bounded by the configured
// timeouts and makes exactly one attempt; retry/fallback policy belongs to
// the caller.
class SingleInstanceClient {
public:
    explicit SingleInstanceClient(LocalTransport& transport, ClientOptions options = {});
    virtual ~SingleInstanceClient() = default;

    // Normalizes the list and writes it as one line to the running instance.
    // An empty list fails without connecting.
    Result<void> send(const std::string& app_id, const FileList& files);

    // true when the running instance accepted the list.
    virtual bool send_file_list_to_running_app(const std::string& app_id,
                                               const FileList& files);

private:
    LocalTransport& transport_;
    ClientOptions options_;
};
