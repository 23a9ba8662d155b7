#pragma once

// POSIX socket helpers for the SSH transport.

#include <poll.h>

using socket_t = int;
#define PORTSCOPE_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Wait for a non-blocking connect() to finish.
// Returns 0 on success, ETIMEDOUT on timeout, or the socket's error code.
int wait_connected(socket_t sock, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
