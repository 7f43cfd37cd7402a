#pragma once

#include <chrono>
#include <string>
#include <unistd.h>
#include "exec_channel.hpp"

// Local descriptors wired to the remote command. Never closed by the relay.
struct StreamSet {
    int in = STDIN_FILENO;
    int out = STDOUT_FILENO;
    int err = STDERR_FILENO;
};

// StreamRelay: pump local stdin into an exec channel and the channel's
// stdout/stderr back out, until the remote command finishes.
//
// Protocol: stdin -> channel until local EOF, then send channel EOF ->
//           relay output until remote EOF -> drain -> close -> exit status.
//
//     StreamRelay relay(*channel);
//     int status = relay.run(std::chrono::seconds(0));   // 0 = no deadline
//
class StreamRelay {
public:
    explicit StreamRelay(ExecChannel& channel, StreamSet streams = StreamSet{});

    // Blocks until the remote command completes and returns its exit status.
    // Throws SSHTimeoutError if it hasn't completed within timeout (zero
    // means wait forever) and SSHIOError on channel or local write errors.
    int run(std::chrono::milliseconds timeout);

private:
    ExecChannel& channel_;
    StreamSet streams_;
    bool stdin_open_ = true;
    bool eof_sent_ = false;
    std::string pending_;   // read from stdin, not yet accepted by the channel

    void pump_stdin(bool readable);
    void flush_pending();
    void finish_stdin();
    void drain_output();
    bool drain_one(bool is_stderr);
};
