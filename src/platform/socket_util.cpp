#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

void set_nonblocking(int sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(int sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(int sock) {
    close(sock);
}

static Result<int> connect_one(const struct addrinfo* ai, int timeout_secs) {
    int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        return Result<int>::Err(fmt::format("Failed to create socket: {}", strerror(errno)));
    }
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        close_socket(sock);
        return Result<int>::Err(fmt::format("Failed to connect: {}", strerror(err)));
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_secs * 1000);
        if (revents == 0) {
            close_socket(sock);
            return Result<int>::Err("Connection timed out");
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<int>::Err(fmt::format("Connection failed: {}", strerror(sock_err)));
        }
    }
    return Result<int>::Ok(sock);
}

Result<int> connect_tcp(const std::string& host, int port, int timeout_secs) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        return Result<int>::Err(fmt::format("Failed to resolve host {}: {}", host, gai_strerror(rc)));
    }

    Result<int> last = Result<int>::Err("No addresses for host: " + host);
    for (auto* ai = results; ai; ai = ai->ai_next) {
        last = connect_one(ai, timeout_secs);
        if (last.is_ok()) break;
    }
    freeaddrinfo(results);

    if (last.is_err()) {
        last.error = fmt::format("{} ({}:{})", last.error, host, port);
    }
    return last;
}

void enable_keepalive(int sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

} // namespace platform
