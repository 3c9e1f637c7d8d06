#pragma once

// Socket helpers for the SSH transport.

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define JOBRUNNER_INVALID_SOCKET (-1)

namespace platform {

// Open a non-blocking TCP connection to host:port (IPv4 literal or name).
// Waits up to timeout_ms for the connect to finish.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

void set_nonblocking(socket_t sock);

// Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

void close_socket(socket_t sock);

} // namespace platform
