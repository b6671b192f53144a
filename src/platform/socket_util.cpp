#include "socket_util.hpp"
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace platform {

Deadline deadline_after(int timeout_ms) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

int remaining_ms(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

bool set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
}

void set_cloexec(socket_t sock) {
    int flags = fcntl(sock, F_GETFD, 0);
    if (flags >= 0) fcntl(sock, F_SETFD, flags | FD_CLOEXEC);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret;
    do {
        ret = poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);
    return (ret > 0) ? pfd.revents : 0;
}

long send_nosignal(socket_t sock, const char* data, std::size_t len) {
#ifdef MSG_NOSIGNAL
    return static_cast<long>(send(sock, data, len, MSG_NOSIGNAL));
#else
    // macOS: SO_NOSIGPIPE is set on the socket when it is created
    return static_cast<long>(send(sock, data, len, 0));
#endif
}

void close_socket(socket_t sock) {
    if (sock >= 0) close(sock);
}

std::string last_error_text() {
    return std::strerror(errno);
}

} // namespace platform
