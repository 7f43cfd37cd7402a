#pragma once

#include <chrono>
#include <cstddef>
#include <string>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

enum class ChannelStep {
    DONE,
    AGAIN,   // Would block; retry after polling
    ERROR,
};

// Non-blocking view of a channel running one remote command.
// The stream relay only talks to this interface.
class ExecChannel {
public:
    virtual ~ExecChannel() = default;

    // >0 bytes read, 0 nothing available right now, <0 channel error
    virtual long read_stdout(char* buf, size_t len) = 0;
    virtual long read_stderr(char* buf, size_t len) = 0;

    // Bytes accepted (0 when the remote window is full), <0 channel error
    virtual long write_stdin(const char* buf, size_t len) = 0;

    // Tell the remote command there is no more input.
    virtual ChannelStep send_eof() = 0;

    // Remote side has sent EOF.
    virtual bool eof() = 0;

    // Close the channel and wait for the remote close.
    virtual ChannelStep close() = 0;

    // Exit status reported by the remote command (valid after close()).
    virtual int exit_status() = 0;

    // Signal name (without "SIG") if the remote command was killed by one,
    // empty otherwise. Valid after close().
    virtual std::string exit_signal() = 0;

    // Descriptor to poll for progress, or -1 if there is none.
    virtual int poll_fd() const = 0;

    // poll() events the transport is currently blocked on.
    virtual short poll_events() const = 0;

    // Called once per relay iteration (session keepalives).
    virtual void tick() {}

    virtual std::string last_error() const = 0;
};

// ExecChannel over a libssh2 session in non-blocking mode. Owns the channel
// and frees it on destruction; the session must outlive it.
class Libssh2ExecChannel : public ExecChannel {
public:
    // Opens a session channel and execs command. Throws SSHIOError on
    // failure, SSHTimeoutError if the server does not answer in time.
    Libssh2ExecChannel(LIBSSH2_SESSION* session, int sock, const std::string& command,
                       std::chrono::milliseconds timeout);
    ~Libssh2ExecChannel() override;

    Libssh2ExecChannel(const Libssh2ExecChannel&) = delete;
    Libssh2ExecChannel& operator=(const Libssh2ExecChannel&) = delete;

    long read_stdout(char* buf, size_t len) override;
    long read_stderr(char* buf, size_t len) override;
    long write_stdin(const char* buf, size_t len) override;
    ChannelStep send_eof() override;
    bool eof() override;
    ChannelStep close() override;
    int exit_status() override;
    std::string exit_signal() override;
    int poll_fd() const override { return sock_; }
    short poll_events() const override;
    void tick() override;
    std::string last_error() const override;

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_ = nullptr;
    int sock_;
    bool closed_ = false;
};
