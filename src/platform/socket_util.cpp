#include "socket_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

static void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

// Returns an errno value, 0 once connected.
static int connect_one(socket_t sock, const struct addrinfo* ai, int timeout_ms) {
    if (connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) return 0;
    if (errno != EINPROGRESS) return errno;

    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    if (poll(&pfd, 1, timeout_ms) <= 0) return ETIMEDOUT;

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len) != 0) return errno;
    return sock_err;
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* info = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &info);
    if (gai != 0 || !info) {
        return Result<socket_t>::Err("Failed to resolve host " + host + ": " + gai_strerror(gai));
    }

    std::string last_error = "no usable address";
    for (const struct addrinfo* ai = info; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int err = connect_one(sock, ai, timeout_ms);
        if (err == 0) {
            freeaddrinfo(info);
            return Result<socket_t>::Ok(sock);
        }
        last_error = err == ETIMEDOUT ? "Connection timed out" : std::strerror(err);
        close(sock);
    }

    freeaddrinfo(info);
    return Result<socket_t>::Err("Failed to connect to " + host + ":" + service + ": " + last_error);
}

void enable_keepalive(socket_t sock, int idle_secs) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &idle_secs, sizeof(idle_secs));
#else
    (void)idle_secs;
#endif
}

void close_socket(socket_t sock) {
    if (sock != SSHCP_INVALID_SOCKET) close(sock);
}

} // namespace platform
