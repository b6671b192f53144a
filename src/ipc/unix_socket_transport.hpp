#pragma once

#include "transport.hpp"
#include <platform/singleton.hpp>
#include <platform/socket_util.hpp>

class UnixSocketStream : public LocalStream {
public:
    explicit UnixSocketStream(socket_t fd);
    ~UnixSocketStream() override;

    UnixSocketStream(const UnixSocketStream&) = delete;
    UnixSocketStream& operator=(const UnixSocketStream&) = delete;

    Result<void> send_line(const std::string& line, int timeout_ms) override;
    Result<std::string> receive_line(std::size_t max_bytes, int timeout_ms) override;

private:
    socket_t fd_;
};

class UnixSocketListener : public LocalListener {
public:
    UnixSocketListener(socket_t fd, std::string path, ClaimLock lock);
    ~UnixSocketListener() override;

    UnixSocketListener(const UnixSocketListener&) = delete;
    UnixSocketListener& operator=(const UnixSocketListener&) = delete;

    std::unique_ptr<LocalStream> accept(int timeout_ms) override;
    const std::string& endpoint() const override { return path_; }

private:
    socket_t fd_;
    std::string path_;
    ClaimLock lock_;   // released after the socket file is gone
};

class UnixSocketTransport : public LocalTransport {
public:
    explicit UnixSocketTransport(TransportOptions options);

    std::string endpoint_for(const std::string& app_id) const override;
    Result<std::unique_ptr<LocalListener>> listen(const std::string& endpoint) override;
    Result<std::unique_ptr<LocalStream>> connect(const std::string& endpoint,
                                                 int timeout_ms) override;

private:
    TransportOptions options_;

    // True if something accepts connections on the socket path.
    bool is_live(const std::string& path);
};
