#include "exec_channel.hpp"
#include "session.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <poll.h>

// Upper bound for the best-effort close in the destructor
static constexpr int TEARDOWN_TIMEOUT_MS = 2000;

Libssh2ExecChannel::Libssh2ExecChannel(LIBSSH2_SESSION* session, int sock,
                                       const std::string& command,
                                       std::chrono::milliseconds timeout)
    : session_(session), sock_(sock) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            throw SSHIOError("Failed to open exec channel: " + ssh_last_error(session_));
        }
        if (!ssh_wait_socket(session_, sock_, deadline)) {
            throw SSHTimeoutError("Timed out opening exec channel");
        }
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel_, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (!ssh_wait_socket(session_, sock_, deadline)) {
            throw SSHTimeoutError("Timed out starting remote command: " + command);
        }
    }
    if (rc != 0) {
        throw SSHIOError(fmt::format("Failed to exec '{}': {}", command, ssh_last_error(session_)));
    }

    log_debug(fmt::format("Exec channel open: {}", command));
}

Libssh2ExecChannel::~Libssh2ExecChannel() {
    if (!channel_) return;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(TEARDOWN_TIMEOUT_MS);

    if (!closed_) {
        ChannelStep step;
        while ((step = close()) == ChannelStep::AGAIN) {
            if (!ssh_wait_socket(session_, sock_, deadline)) break;
        }
    }

    while (libssh2_channel_free(channel_) == LIBSSH2_ERROR_EAGAIN) {
        if (!ssh_wait_socket(session_, sock_, deadline)) break;
    }
    channel_ = nullptr;
}

long Libssh2ExecChannel::read_stdout(char* buf, size_t len) {
    ssize_t n = libssh2_channel_read(channel_, buf, len);
    if (n == LIBSSH2_ERROR_EAGAIN) return 0;
    return static_cast<long>(n);
}

long Libssh2ExecChannel::read_stderr(char* buf, size_t len) {
    ssize_t n = libssh2_channel_read_stderr(channel_, buf, len);
    if (n == LIBSSH2_ERROR_EAGAIN) return 0;
    return static_cast<long>(n);
}

long Libssh2ExecChannel::write_stdin(const char* buf, size_t len) {
    ssize_t n = libssh2_channel_write(channel_, buf, len);
    if (n == LIBSSH2_ERROR_EAGAIN) return 0;
    return static_cast<long>(n);
}

ChannelStep Libssh2ExecChannel::send_eof() {
    int rc = libssh2_channel_send_eof(channel_);
    if (rc == LIBSSH2_ERROR_EAGAIN) return ChannelStep::AGAIN;
    return rc == 0 ? ChannelStep::DONE : ChannelStep::ERROR;
}

bool Libssh2ExecChannel::eof() {
    return libssh2_channel_eof(channel_) == 1;
}

ChannelStep Libssh2ExecChannel::close() {
    if (closed_) return ChannelStep::DONE;

    // libssh2_channel_close sends our CLOSE and waits for the server's
    int rc = libssh2_channel_close(channel_);
    if (rc == LIBSSH2_ERROR_EAGAIN) return ChannelStep::AGAIN;
    if (rc != 0) return ChannelStep::ERROR;

    closed_ = true;
    return ChannelStep::DONE;
}

int Libssh2ExecChannel::exit_status() {
    return libssh2_channel_get_exit_status(channel_);
}

std::string Libssh2ExecChannel::exit_signal() {
    char* name = nullptr;
    size_t name_len = 0;
    int rc = libssh2_channel_get_exit_signal(channel_, &name, &name_len,
                                             nullptr, nullptr, nullptr, nullptr);
    if (rc != 0 || !name) return "";

    std::string signal(name, name_len);
    libssh2_free(session_, name);
    return signal;
}

short Libssh2ExecChannel::poll_events() const {
    short events = POLLIN;
    if (libssh2_session_block_directions(session_) & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
        events |= POLLOUT;
    }
    return events;
}

void Libssh2ExecChannel::tick() {
    int seconds_to_next = 0;
    int rc = libssh2_keepalive_send(session_, &seconds_to_next);
    if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
        log_debug(fmt::format("Keepalive failed: {}", ssh_last_error(session_)));
    }
}

std::string Libssh2ExecChannel::last_error() const {
    return ssh_last_error(session_);
}
