#include "stream_relay.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>

StreamRelay::StreamRelay(ExecChannel& channel, StreamSet streams)
    : channel_(channel), streams_(streams) {
}

int StreamRelay::run(std::chrono::milliseconds timeout) {
    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto poll_slice = [&]() -> int {
        if (!bounded) return RELAY_POLL_MS;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        return static_cast<int>(std::max<long long>(0, std::min<long long>(left, RELAY_POLL_MS)));
    };
    auto check_deadline = [&]() {
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            throw SSHTimeoutError(fmt::format(
                "Failed to retrieve command result within {} ms", timeout.count()));
        }
    };

    if (streams_.in < 0) stdin_open_ = false;

    // ── Relay until the remote side sends EOF ──
    while (true) {
        check_deadline();
        channel_.tick();

        struct pollfd fds[2];
        nfds_t nfds = 0;
        int stdin_idx = -1;

        if (stdin_open_ && pending_.empty()) {
            fds[nfds] = {streams_.in, POLLIN, 0};
            stdin_idx = static_cast<int>(nfds++);
        }
        if (channel_.poll_fd() >= 0) {
            fds[nfds] = {channel_.poll_fd(), channel_.poll_events(), 0};
            nfds++;
        }

        int ready = poll(fds, nfds, poll_slice());
        if (ready < 0 && errno != EINTR) {
            throw SSHIOError(std::string("poll failed: ") + std::strerror(errno));
        }

        bool stdin_ready = ready > 0 && stdin_idx >= 0 && fds[stdin_idx].revents != 0;

        if (!pending_.empty()) {
            flush_pending();
        } else if (stdin_ready) {
            pump_stdin((fds[stdin_idx].revents & POLLNVAL) == 0);
        }
        if (!stdin_open_ && pending_.empty() && !eof_sent_) {
            finish_stdin();
        }

        drain_output();

        if (channel_.eof()) {
            // Output that arrived with the EOF packet
            drain_output();
            break;
        }
    }

    // ── Close and collect the exit status ──
    while (true) {
        ChannelStep step = channel_.close();
        if (step == ChannelStep::DONE) break;
        if (step == ChannelStep::ERROR) {
            throw SSHIOError("Failed to close exec channel: " + channel_.last_error());
        }
        check_deadline();

        struct pollfd pfd = {channel_.poll_fd(), channel_.poll_events(), 0};
        poll(&pfd, pfd.fd >= 0 ? 1 : 0, poll_slice());
    }

    std::string sig_name = channel_.exit_signal();
    if (!sig_name.empty()) {
        throw SSHIOError(fmt::format("Remote command terminated by signal SIG{}", sig_name));
    }

    int status = channel_.exit_status();
    log_debug(fmt::format("Remote command exited with status {}", status));
    return status;
}

void StreamRelay::pump_stdin(bool readable) {
    if (!readable) {
        stdin_open_ = false;
        return;
    }

    char buf[SSH_READ_BUF_SIZE];
    ssize_t n = ::read(streams_.in, buf, sizeof(buf));
    if (n > 0) {
        pending_.assign(buf, static_cast<size_t>(n));
        flush_pending();
    } else if (n == 0) {
        log_debug("Local stdin reached EOF");
        stdin_open_ = false;
    } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
        log_debug(fmt::format("Stopped reading stdin: {}", std::strerror(errno)));
        stdin_open_ = false;
    }
}

void StreamRelay::flush_pending() {
    long w = channel_.write_stdin(pending_.data(), pending_.size());
    if (w < 0) {
        // The remote command stopped taking input; its exit status still counts
        log_debug("Remote stdin closed: " + channel_.last_error());
        pending_.clear();
        stdin_open_ = false;
        eof_sent_ = true;
        return;
    }
    pending_.erase(0, static_cast<size_t>(w));
}

void StreamRelay::finish_stdin() {
    ChannelStep step = channel_.send_eof();
    if (step == ChannelStep::AGAIN) return;
    if (step == ChannelStep::ERROR) {
        log_debug("Failed to send EOF: " + channel_.last_error());
    }
    eof_sent_ = true;
}

void StreamRelay::drain_output() {
    while (drain_one(false)) {}
    while (drain_one(true)) {}
}

bool StreamRelay::drain_one(bool is_stderr) {
    char buf[SSH_READ_BUF_SIZE];
    long n = is_stderr ? channel_.read_stderr(buf, sizeof(buf))
                       : channel_.read_stdout(buf, sizeof(buf));
    if (n == 0) return false;
    if (n < 0) {
        throw SSHIOError("Failed to read from exec channel: " + channel_.last_error());
    }

    int fd = is_stderr ? streams_.err : streams_.out;
    if (!platform::write_all(fd, buf, static_cast<size_t>(n))) {
        throw SSHIOError(fmt::format("Failed to write to local {}: {}",
                                     is_stderr ? "stderr" : "stdout", std::strerror(errno)));
    }
    return true;
}
