#include "unix_socket_transport.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <utility>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace fs = std::filesystem;

static bool make_address(const std::string& path, struct sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) return false;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

static socket_t open_stream_socket() {
    socket_t fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return HANDOFF_INVALID_SOCKET;
    platform::set_cloexec(fd);
#ifdef SO_NOSIGPIPE
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
    return fd;
}

// ── UnixSocketStream ─────────────────────────────────────────

UnixSocketStream::UnixSocketStream(socket_t fd) : fd_(fd) {}

UnixSocketStream::~UnixSocketStream() {
    platform::close_socket(fd_);
}

Result<void> UnixSocketStream::send_line(const std::string& line, int timeout_ms) {
    std::string data = line + "\n";
    auto deadline = platform::deadline_after(timeout_ms);
    std::size_t sent = 0;

    while (sent < data.size()) {
        long n = platform::send_nosignal(fd_, data.data() + sent, data.size() - sent);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            int left = platform::remaining_ms(deadline);
            if (left == 0 || platform::poll_socket(fd_, POLLOUT, left) == 0) {
                return Result<void>::Err(ErrorCode::Timeout,
                    fmt::format("write timed out after {}ms ({} of {} bytes)",
                                timeout_ms, sent, data.size()));
            }
            continue;
        }
        return Result<void>::Err(ErrorCode::IoError,
            "write failed: " + platform::last_error_text());
    }
    return Result<void>::Ok();
}

Result<std::string> UnixSocketStream::receive_line(std::size_t max_bytes, int timeout_ms) {
    std::string buffer;
    char chunk[READ_BUF_SIZE];
    auto deadline = platform::deadline_after(timeout_ms);

    for (;;) {
        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n > 0) {
            std::size_t scan_from = buffer.size();
            buffer.append(chunk, static_cast<std::size_t>(n));
            auto nl = buffer.find('\n', scan_from);
            if (nl != std::string::npos) {
                if (nl > max_bytes) {
                    return Result<std::string>::Err(ErrorCode::MalformedMessage,
                        fmt::format("line exceeds {} bytes", max_bytes));
                }
                return Result<std::string>::Ok(buffer.substr(0, nl));
            }
            if (buffer.size() > max_bytes) {
                return Result<std::string>::Err(ErrorCode::MalformedMessage,
                    fmt::format("line exceeds {} bytes", max_bytes));
            }
            continue;
        }
        if (n == 0) {
            // Peer closed: an unterminated line still counts as the message
            if (buffer.empty()) {
                return Result<std::string>::Err(ErrorCode::IoError,
                    "connection closed before any data");
            }
            return Result<std::string>::Ok(std::move(buffer));
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            int left = platform::remaining_ms(deadline);
            if (left == 0 || platform::poll_socket(fd_, POLLIN, left) == 0) {
                return Result<std::string>::Err(ErrorCode::Timeout,
                    fmt::format("read timed out after {}ms", timeout_ms));
            }
            continue;
        }
        return Result<std::string>::Err(ErrorCode::IoError,
            "read failed: " + platform::last_error_text());
    }
}

// ── UnixSocketListener ───────────────────────────────────────

UnixSocketListener::UnixSocketListener(socket_t fd, std::string path, ClaimLock lock)
    : fd_(fd), path_(std::move(path)), lock_(std::move(lock)) {}

UnixSocketListener::~UnixSocketListener() {
    platform::close_socket(fd_);
    if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
        log_warn("transport", fmt::format("could not remove {}: {}",
                                          path_, platform::last_error_text()));
    }
}

std::unique_ptr<LocalStream> UnixSocketListener::accept(int timeout_ms) {
    if (platform::poll_socket(fd_, POLLIN, timeout_ms) == 0) return nullptr;

    socket_t client = ::accept(fd_, nullptr, nullptr);
    if (client < 0) return nullptr;  // EAGAIN: the client gave up already

    platform::set_cloexec(client);
    platform::set_nonblocking(client);
#ifdef SO_NOSIGPIPE
    int one = 1;
    setsockopt(client, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
    return std::make_unique<UnixSocketStream>(client);
}

// ── UnixSocketTransport ──────────────────────────────────────

UnixSocketTransport::UnixSocketTransport(TransportOptions options)
    : options_(std::move(options)) {}

std::string UnixSocketTransport::endpoint_for(const std::string& app_id) const {
    constexpr std::size_t max_len = sizeof(sockaddr_un::sun_path) - 1;
    std::string name = endpoint_base_name(app_id) + ".sock";
    fs::path dir = options_.runtime_dir.empty() ? platform::runtime_dir()
                                                : options_.runtime_dir;

    std::string full = (dir / name).string();
    if (full.size() <= max_len) return full;

    // Deep runtime dirs (macOS $TMPDIR) overflow sun_path; /tmp is short
    full = (fs::path("/tmp") / name).string();
    if (full.size() <= max_len) return full;
    return full.substr(0, max_len);
}

bool UnixSocketTransport::is_live(const std::string& path) {
    auto probe = connect(path, options_.probe_timeout_ms);
    return probe.is_ok();
}

Result<std::unique_ptr<LocalListener>> UnixSocketTransport::listen(const std::string& endpoint) {
    using R = Result<std::unique_ptr<LocalListener>>;

    struct sockaddr_un addr;
    if (!make_address(endpoint, addr)) {
        return R::Err(ErrorCode::InvalidArgument,
                      fmt::format("socket path unusable: '{}'", endpoint));
    }

    ClaimLock lock(endpoint + ".lock");
    if (!lock.held()) {
        if (lock.contended()) {
            return R::Err(ErrorCode::ClaimFailed,
                          fmt::format("{} is owned by a running instance", endpoint));
        }
        return R::Err(ErrorCode::IoError,
                      fmt::format("cannot lock {}: {}", lock.path(), lock.error()));
    }

    socket_t fd = open_stream_socket();
    if (fd == HANDOFF_INVALID_SOCKET) {
        return R::Err(ErrorCode::IoError, "socket() failed: " + platform::last_error_text());
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno != EADDRINUSE) {
            std::string err = platform::last_error_text();
            platform::close_socket(fd);
            return R::Err(ErrorCode::IoError, fmt::format("bind({}) failed: {}", endpoint, err));
        }
        // A listener that does not honour the lock file still counts as live
        if (is_live(endpoint)) {
            platform::close_socket(fd);
            return R::Err(ErrorCode::ClaimFailed,
                          fmt::format("{} is served by a running instance", endpoint));
        }
        log_warn("transport", fmt::format("removing stale socket {}", endpoint));
        unlink(endpoint.c_str());
        if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
            std::string err = platform::last_error_text();
            platform::close_socket(fd);
            return R::Err(ErrorCode::IoError,
                          fmt::format("bind({}) failed after stale cleanup: {}", endpoint, err));
        }
    }

    chmod(endpoint.c_str(), 0600);

    if (::listen(fd, SOMAXCONN) != 0 || !platform::set_nonblocking(fd)) {
        std::string err = platform::last_error_text();
        platform::close_socket(fd);
        unlink(endpoint.c_str());
        return R::Err(ErrorCode::IoError, fmt::format("listen({}) failed: {}", endpoint, err));
    }

    return R::Ok(std::make_unique<UnixSocketListener>(fd, endpoint, std::move(lock)));
}

Result<std::unique_ptr<LocalStream>> UnixSocketTransport::connect(const std::string& endpoint,
                                                                  int timeout_ms) {
    using R = Result<std::unique_ptr<LocalStream>>;

    struct sockaddr_un addr;
    if (!make_address(endpoint, addr)) {
        return R::Err(ErrorCode::ConnectFailed,
                      fmt::format("socket path unusable: '{}'", endpoint));
    }

    socket_t fd = open_stream_socket();
    if (fd == HANDOFF_INVALID_SOCKET || !platform::set_nonblocking(fd)) {
        platform::close_socket(fd);
        return R::Err(ErrorCode::IoError, "socket() failed: " + platform::last_error_text());
    }

    auto deadline = platform::deadline_after(timeout_ms);
    for (;;) {
        if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0 ||
            errno == EISCONN) {
            break;
        }
        if (errno == EINTR) continue;

        if (errno == EAGAIN) {
            // Linux: listener backlog is full; wait for it to drain
            if (platform::remaining_ms(deadline) == 0) {
                platform::close_socket(fd);
                return R::Err(ErrorCode::Timeout,
                              fmt::format("connect({}) timed out", endpoint));
            }
            platform::sleep_ms(10);
            continue;
        }

        if (errno == EINPROGRESS || errno == EALREADY) {
            int left = platform::remaining_ms(deadline);
            if (left == 0 || platform::poll_socket(fd, POLLOUT, left) == 0) {
                platform::close_socket(fd);
                return R::Err(ErrorCode::Timeout,
                              fmt::format("connect({}) timed out", endpoint));
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                platform::close_socket(fd);
                return R::Err(ErrorCode::ConnectFailed,
                              fmt::format("connect({}) failed: {}", endpoint,
                                          std::strerror(so_error)));
            }
            break;
        }

        std::string err = platform::last_error_text();
        platform::close_socket(fd);
        return R::Err(ErrorCode::ConnectFailed,
                      fmt::format("connect({}) failed: {}", endpoint, err));
    }

    return R::Ok(std::make_unique<UnixSocketStream>(fd));
}

std::unique_ptr<LocalTransport> make_local_transport(const TransportOptions& options) {
    return std::make_unique<UnixSocketTransport>(options);
}
