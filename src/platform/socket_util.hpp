#pragma once

// Socket helpers for the SSH transport.

#include <string>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define DEVPROBE_INVALID_SOCKET INVALID_SOCKET
#else
#  include <poll.h>
   using socket_t = int;
#  define DEVPROBE_INVALID_SOCKET (-1)
#endif

namespace platform {

// Resolve host (dotted quad or name) and connect a non-blocking TCP socket,
// waiting at most timeout_ms for the connection to complete.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Turn on TCP keepalive probing (idle 60s, interval 15s, 4 probes).
void enable_keepalive(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
