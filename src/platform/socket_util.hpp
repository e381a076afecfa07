#pragma once

#include <poll.h>
#include <string>
#include <core/types.hpp>

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(int sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(int sock, short events, int timeout_ms);

void close_socket(int sock);

// Resolve `host` and open a non-blocking TCP connection to it, trying every
// address the resolver returns. The connect is bounded by timeout_secs.
Result<int> connect_tcp(const std::string& host, int port, int timeout_secs);

// Enable TCP keepalive probes on an established connection.
void enable_keepalive(int sock);

} // namespace platform
