#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "exec_channel.hpp"
#include "keys.hpp"
#include "known_hosts.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

using Deadline = std::chrono::steady_clock::time_point;

// Human-readable description of the session's last libssh2 error.
std::string ssh_last_error(LIBSSH2_SESSION* session);

// Wait until the socket is ready in whichever direction libssh2 is blocked
// on. Returns false once the deadline has passed.
bool ssh_wait_socket(LIBSSH2_SESSION* session, int sock, Deadline deadline);

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    int timeout = 30;   // seconds, TCP connect + handshake
};

// Holds a libssh2_init() reference for as long as it lives.
class Libssh2Library {
public:
    Libssh2Library();
    ~Libssh2Library();

    Libssh2Library(const Libssh2Library&) = delete;
    Libssh2Library& operator=(const Libssh2Library&) = delete;
};

// One client connection: socket, libssh2 session, authentication.
// Everything it acquires is released by the destructor.
//
// Usage:
//   SSHSession session(target);
//   session.apply_properties(props);     // before connect
//   session.connect(verifier);
//   session.authenticate(keys, 10s);
//   auto channel = session.open_exec("uptime", timeout);
//
class SSHSession {
public:
    explicit SSHSession(const SessionTarget& target);
    ~SSHSession();

    SSHSession(const SSHSession&) = delete;
    SSHSession& operator=(const SSHSession&) = delete;

    // Throws SSHIOError on an unknown property or bad value.
    void apply_properties(const PropertyList& properties);

    // Route libssh2's protocol trace for this session into the debug log.
    void enable_trace();

    // TCP connect, handshake, and host key verification. Throws SSHIOError.
    void connect(HostKeyVerifier& verifier, StatusCallback callback = nullptr);

    // Public-key authentication with every key in order. Throws
    // SSHTimeoutError past the deadline, SSHIOError on rejection.
    void authenticate(const std::vector<KeyPair>& keys, std::chrono::milliseconds timeout,
                      StatusCallback callback = nullptr);

    std::unique_ptr<Libssh2ExecChannel> open_exec(const std::string& command,
                                                  std::chrono::milliseconds timeout);

    LIBSSH2_SESSION* get_raw_session() { return session_; }

private:
    Libssh2Library library_;
    SessionTarget target_;
    platform::SocketGuard sock_;
    LIBSSH2_SESSION* session_ = nullptr;
    bool handshake_done_ = false;
    std::string target_str_;

    HostKey remote_host_key() const;
    void close();
};
