#pragma once

#include <string>
#include <core/types.hpp>

using socket_t = int;
#define SSHCP_INVALID_SOCKET (-1)

namespace platform {

// Resolve `host` (IPv4, IPv6 or a name) and connect to the first address
// that answers within timeout_ms. The returned socket is non-blocking.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// SO_KEEPALIVE, plus TCP_KEEPIDLE where the platform has it.
void enable_keepalive(socket_t sock, int idle_secs);

void close_socket(socket_t sock);

} // namespace platform
