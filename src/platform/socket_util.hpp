#pragma once

// POSIX socket helpers for the SSH transport.

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define CECSSH_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc. timeout_ms < 0 waits forever.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and open a non-blocking TCP connection to host:port.
// timeout_ms <= 0 waits for the kernel to give up on its own.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Turn on TCP keepalive probes (idle 60s, interval 15s, 4 probes).
void enable_tcp_keepalive(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
