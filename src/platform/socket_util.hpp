#pragma once

// Helpers for local stream sockets (Unix domain sockets).

#include <string>
#include <chrono>
#include <poll.h>

using socket_t = int;
#define HANDOFF_INVALID_SOCKET (-1)

namespace platform {

using Deadline = std::chrono::steady_clock::time_point;

// Deadline timeout_ms from now.
Deadline deadline_after(int timeout_ms);

// Milliseconds left until the deadline, clamped at 0.
int remaining_ms(Deadline deadline);

// Set a socket to non-blocking mode. Returns false on failure.
bool set_nonblocking(socket_t sock);

// Mark a descriptor close-on-exec so launched children don't inherit it.
void set_cloexec(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc. EINTR is retried.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Send with SIGPIPE suppressed. Same return as send(2).
long send_nosignal(socket_t sock, const char* data, std::size_t len);

// Close a socket.
void close_socket(socket_t sock);

// errno as text
std::string last_error_text();

} // namespace platform
