#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

#define SSHRUN_INVALID_SOCKET (-1)

using socket_t = int;

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host (IPv4 or IPv6) and open a non-blocking TCP connection,
// trying each address in turn until one connects within timeout_ms.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Owns a socket descriptor; closes it on destruction.
class SocketGuard {
public:
    SocketGuard() = default;
    explicit SocketGuard(socket_t sock) : sock_(sock) {}
    ~SocketGuard() { reset(); }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    socket_t get() const { return sock_; }
    bool valid() const { return sock_ != SSHRUN_INVALID_SOCKET; }

    void reset(socket_t sock = SSHRUN_INVALID_SOCKET) {
        if (sock_ != SSHRUN_INVALID_SOCKET) close_socket(sock_);
        sock_ = sock;
    }

private:
    socket_t sock_ = SSHRUN_INVALID_SOCKET;
};

} // namespace platform
