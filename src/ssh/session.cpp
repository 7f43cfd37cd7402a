#include "session.hpp"
#include "auth.hpp"
#include "client_properties.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <poll.h>
#include <algorithm>

// ── Helpers ──────────────────────────────────────────────────────────

std::string ssh_last_error(LIBSSH2_SESSION* session) {
    if (!session) return "no session";
    char* msg = nullptr;
    int len = 0;
    int code = libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return fmt::format("libssh2 error {}", code);
    return fmt::format("{} (libssh2 error {})", std::string(msg, len), code);
}

bool ssh_wait_socket(LIBSSH2_SESSION* session, int sock, Deadline deadline) {
    int timeout_ms = 1000;
    if (deadline != Deadline::max()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        timeout_ms = static_cast<int>(std::min<long long>(left.count() + 1, 1000));
    }

    short events = 0;
    int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    platform::poll_socket(sock, events, timeout_ms);
    return deadline == Deadline::max() || std::chrono::steady_clock::now() < deadline;
}

static void trace_to_log(LIBSSH2_SESSION* /*session*/, void* /*context*/,
                         const char* data, size_t length) {
    std::string line(data, length);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    log_debug("libssh2: " + line);
}

// ── Libssh2Library ───────────────────────────────────────────────────

Libssh2Library::Libssh2Library() {
    int rc = libssh2_init(0);
    if (rc != 0) {
        throw SSHIOError(fmt::format("Failed to initialize libssh2 (error {})", rc));
    }
}

Libssh2Library::~Libssh2Library() {
    libssh2_exit();
}

// ── SSHSession ───────────────────────────────────────────────────────

SSHSession::SSHSession(const SessionTarget& target)
    : target_(target) {
    target_str_ = fmt::format("{}@{}:{}", target_.user, target_.host, target_.port);

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        throw SSHIOError("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);
}

SSHSession::~SSHSession() {
    close();
}

void SSHSession::apply_properties(const PropertyList& properties) {
    for (const auto& prop : properties) {
        auto r = apply_client_property(session_, prop.first, prop.second);
        if (r.is_err()) {
            throw SSHIOError(r.error);
        }
    }
}

void SSHSession::enable_trace() {
    libssh2_trace_sethandler(session_, nullptr, trace_to_log);
    libssh2_trace(session_, LIBSSH2_TRACE_KEX | LIBSSH2_TRACE_AUTH |
                            LIBSSH2_TRACE_CONN | LIBSSH2_TRACE_ERROR);
}

void SSHSession::connect(HostKeyVerifier& verifier, StatusCallback callback) {
    if (callback) callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        throw SSHIOError(sock.error);
    }
    sock_.reset(sock.value);

    if (callback) callback("TCP connected, starting SSH handshake...");

    // SSH handshake (key exchange)
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_.get())) == LIBSSH2_ERROR_EAGAIN) {
        if (!ssh_wait_socket(session_, sock_.get(), deadline)) {
            throw SSHIOError(fmt::format("SSH handshake with {} timed out", target_str_));
        }
    }
    if (rc != 0) {
        throw SSHIOError(fmt::format("SSH handshake with {}:{} failed: {}",
                                     target_.host, target_.port, ssh_last_error(session_)));
    }
    handshake_done_ = true;

    HostKey key = remote_host_key();
    auto verified = verifier.verify(target_.host, target_.port, key);
    if (verified.is_err()) {
        throw SSHIOError(verified.error);
    }

    log_debug(fmt::format("Connected to {} ({} host key)", target_str_, key.type_name()));
}

HostKey SSHSession::remote_host_key() const {
    size_t len = 0;
    int type = 0;
    const char* blob = libssh2_session_hostkey(session_, &len, &type);
    if (!blob || len == 0) {
        throw SSHIOError("Failed to obtain the remote host key");
    }

    HostKey key;
    key.blob.assign(blob, len);
    key.type = type;
    return key;
}

void SSHSession::authenticate(const std::vector<KeyPair>& keys,
                              std::chrono::milliseconds timeout,
                              StatusCallback callback) {
    if (!handshake_done_) {
        throw SSHIOError("Cannot authenticate before the SSH handshake");
    }
    if (callback) callback("Authenticating...");

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.size()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            log_debug("Server accepted 'none' authentication");
            return;
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            throw SSHIOError("Failed to query authentication methods: " + ssh_last_error(session_));
        }
        if (!ssh_wait_socket(session_, sock_.get(), deadline)) {
            throw SSHTimeoutError(fmt::format(
                "Authentication did not complete within {} ms", timeout.count()));
        }
    }

    std::string methods = auth_list;
    log_debug("Auth methods: " + methods);
    if (methods.find("publickey") == std::string::npos) {
        throw SSHIOError(fmt::format("{} does not accept public-key authentication (offers: {})",
                                     target_str_, methods));
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

    const KeyPair& accepted = authenticate_with_keys(
        keys, libssh2_key_attempt(session_, target_.user), remaining,
        [this](Deadline until) { return ssh_wait_socket(session_, sock_.get(), until); });

    if (callback) callback("Authenticated with " + accepted.private_key.filename().string());
}

std::unique_ptr<Libssh2ExecChannel> SSHSession::open_exec(const std::string& command,
                                                          std::chrono::milliseconds timeout) {
    return std::make_unique<Libssh2ExecChannel>(session_, sock_.get(), command, timeout);
}

void SSHSession::close() {
    if (session_) {
        if (handshake_done_ && sock_.valid()) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (libssh2_session_disconnect(session_, "Normal disconnection") == LIBSSH2_ERROR_EAGAIN) {
                if (!ssh_wait_socket(session_, sock_.get(), deadline)) break;
            }
        }
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    sock_.reset();
}
