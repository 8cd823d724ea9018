#pragma once

// Cross-platform socket utilities.

#include <string>
#include <clusterlink/core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define CLUSTERLINK_INVALID_SOCKET INVALID_SOCKET
#else
#  include <poll.h>
   using socket_t = int;
#  define CLUSTERLINK_INVALID_SOCKET (-1)
#endif

namespace clusterlink {
namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Resolve host and open a non-blocking TCP connection, waiting at most
// timeout_ms for the connect to complete.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// SO_KEEPALIVE plus idle/interval/count where the platform supports them.
void enable_tcp_keepalive(socket_t sock, int idle_secs, int interval_secs, int count);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
} // namespace clusterlink
