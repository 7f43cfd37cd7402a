#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <http/endpoint_resolver.hpp>
#include "keys.hpp"
#include "stream_relay.hpp"

namespace fs = std::filesystem;

enum class RunState {
    IDLE,
    RESOLVING,
    CONNECTING,
    AUTHENTICATING,
    EXECUTING,
    COMPLETED,
    FAILED,
};

const char* run_state_name(RunState state);

struct RunnerOptions {
    fs::path known_hosts;                                    // empty = ~/.ssh/known_hosts
    std::chrono::seconds connect_timeout{SSH_CONNECT_TIMEOUT_SECS};
    std::chrono::seconds auth_timeout{SSH_AUTH_TIMEOUT_SECS};
    std::chrono::seconds exec_timeout{SSH_EXEC_TIMEOUT_SECS};  // 0 = no deadline
    PropertyList default_properties;                         // applied before -sshprop
    bool trace = false;                                      // libssh2 protocol trace
    StreamSet streams;
};

// Runs one command on the SSH endpoint advertised by a web server.
//
// Flow: resolve <base>/login -> connect + verify host key -> public-key
// auth -> exec -> relay streams -> exit status.
class SSHCommandRunner {
public:
    explicit SSHCommandRunner(RunnerOptions options = RunnerOptions{},
                              EndpointResolver resolver = EndpointResolver());

    // Returns the remote exit status, or SSH_ENDPOINT_UNAVAILABLE when the
    // server advertises no endpoint. Throws SSHIOError on connection, host
    // key and authentication failures, SSHTimeoutError on deadlines.
    int run(const std::string& base_url, const std::string& user,
            const std::vector<std::string>& args, const KeyProvider& keys,
            bool strict_host_key, StatusCallback callback = nullptr);

    RunState state() const { return state_; }

private:
    RunnerOptions options_;
    EndpointResolver resolver_;
    RunState state_ = RunState::IDLE;
    StatusCallback callback_;

    void transition(RunState next, const std::string& detail = "");
    int execute(const Endpoint& endpoint, const std::string& user,
                const std::vector<std::string>& args, const KeyProvider& keys,
                bool strict_host_key);
};
