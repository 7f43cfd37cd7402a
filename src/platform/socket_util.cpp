#include "socket_util.hpp"
#include <fmt/format.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

// Non-blocking connect to one resolved address. Returns 0 or an errno value.
static int connect_one(socket_t sock, const struct addrinfo* ai, int timeout_ms) {
    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret == 0) return 0;
    if (errno != EINPROGRESS) return errno;

    int revents = poll_socket(sock, POLLOUT, timeout_ms);
    if (revents == 0) return ETIMEDOUT;

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
    return sock_err;
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<socket_t>::Err(fmt::format("Failed to resolve host {}: {}",
                                                 host, gai_strerror(gai)));
    }

    std::string last_error = "no usable address";
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int err = connect_one(sock, ai, timeout_ms);
        if (err == 0) {
            freeaddrinfo(res);

            int nodelay = 1;
            setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
            int keepalive = 1;
            setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
            return Result<socket_t>::Ok(sock);
        }

        last_error = (err == ETIMEDOUT) ? "connection timed out" : std::strerror(err);
        close_socket(sock);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(fmt::format("Failed to connect to {}:{}: {}",
                                             host, port, last_error));
}

} // namespace platform
