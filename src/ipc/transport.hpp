#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>

// One accepted or connected local stream. Line oriented, every call bounded.
class LocalStream {
public:
    virtual ~LocalStream() = default;

    // Write the whole line (a trailing '\n' is appended) before timeout_ms.
    virtual Result<void> send_line(const std::string& line, int timeout_ms) = 0;

    // Read up to the first '\n' (excluded) or end of stream.
    // Errors: Timeout, MalformedMessage (line exceeds max_bytes), IoError.
    virtual Result<std::string> receive_line(std::size_t max_bytes, int timeout_ms) = 0;
};

// A claimed endpoint. Destroying it releases the claim.
class LocalListener {
public:
    virtual ~LocalListener() = default;

    // Wait up to timeout_ms for a client. nullptr when none arrived.
    virtual std::unique_ptr<LocalStream> accept(int timeout_ms) = 0;

    virtual const std::string& endpoint() const = 0;
};

struct TransportOptions {
    std::filesystem::path runtime_dir;       // socket directory; empty = platform default
    int probe_timeout_ms = PROBE_TIMEOUT_MS;
};

// Local same-machine transport: filesystem-domain sockets on POSIX,
// named pipes on Windows. The rest of the code only sees this interface.
class LocalTransport {
public:
    virtual ~LocalTransport() = default;

    // Endpoint (socket path / pipe name) used for an app_id.
    virtual std::string endpoint_for(const std::string& app_id) const = 0;

    // Exclusively claim the endpoint. ClaimFailed when a live owner exists.
    virtual Result<std::unique_ptr<LocalListener>> listen(const std::string& endpoint) = 0;

    // Connect within timeout_ms. ConnectFailed / Timeout when nobody listens.
    virtual Result<std::unique_ptr<LocalStream>> connect(const std::string& endpoint,
                                                         int timeout_ms) = 0;
};

// Platform transport for this build target.
std::unique_ptr<LocalTransport> make_local_transport(const TransportOptions& options = {});

// "handoff_sendto_<safe app_id>_<user token>"
std::string endpoint_base_name(const std::string& app_id);
