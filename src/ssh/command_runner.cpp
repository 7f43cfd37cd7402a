#include "command_runner.hpp"
#include "command_builder.hpp"
#include "known_hosts.hpp"
#include "session.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::IDLE:           return "idle";
        case RunState::RESOLVING:      return "resolving";
        case RunState::CONNECTING:     return "connecting";
        case RunState::AUTHENTICATING: return "authenticating";
        case RunState::EXECUTING:      return "executing";
        case RunState::COMPLETED:      return "completed";
        case RunState::FAILED:         return "failed";
    }
    return "unknown";
}

SSHCommandRunner::SSHCommandRunner(RunnerOptions options, EndpointResolver resolver)
    : options_(std::move(options)), resolver_(std::move(resolver)) {
}

void SSHCommandRunner::transition(RunState next, const std::string& detail) {
    log_debug(fmt::format("Runner: {} -> {}{}", run_state_name(state_), run_state_name(next),
                          detail.empty() ? "" : " (" + detail + ")"));
    state_ = next;
    if (callback_ && !detail.empty()) callback_(detail);
}

int SSHCommandRunner::run(const std::string& base_url, const std::string& user,
                          const std::vector<std::string>& args, const KeyProvider& keys,
                          bool strict_host_key, StatusCallback callback) {
    callback_ = std::move(callback);
    state_ = RunState::IDLE;

    try {
        transition(RunState::RESOLVING, "Discovering SSH endpoint from " + base_url);
        auto resolved = resolver_.resolve(base_url);
        if (resolved.is_err()) {
            throw SSHIOError(resolved.error);
        }
        if (!resolved.value) {
            transition(RunState::COMPLETED, "");
            return SSH_ENDPOINT_UNAVAILABLE;
        }

        int status = execute(*resolved.value, user, args, keys, strict_host_key);
        transition(RunState::COMPLETED, "");
        return status;
    } catch (const std::exception& e) {
        log_debug(fmt::format("Runner failed while {}: {}", run_state_name(state_), e.what()));
        state_ = RunState::FAILED;
        throw;
    }
}

int SSHCommandRunner::execute(const Endpoint& endpoint, const std::string& user,
                              const std::vector<std::string>& args, const KeyProvider& keys,
                              bool strict_host_key) {
    CommandLine cmd = build_command(args);
    log_debug("Remote command: " + cmd.command);

    SessionTarget target;
    target.host = endpoint.host;
    target.port = endpoint.port;
    target.user = user;
    target.timeout = static_cast<int>(options_.connect_timeout.count());

    transition(RunState::CONNECTING, "Connecting to " + endpoint.to_string());

    SSHSession session(target);
    if (options_.trace) session.enable_trace();
    session.apply_properties(options_.default_properties);
    session.apply_properties(cmd.properties);

    fs::path known_hosts = options_.known_hosts;
    if (known_hosts.empty()) {
        known_hosts = platform::home_dir() / ".ssh" / "known_hosts";
    }
    KnownHostsStore store(session.get_raw_session(), known_hosts);
    auto loaded = store.load();
    if (loaded.is_err()) {
        throw SSHIOError(loaded.error);
    }

    HostKeyVerifier verifier(store, unknown_key_policy(strict_host_key));
    session.connect(verifier, callback_);

    transition(RunState::AUTHENTICATING, "Authenticating as " + user);
    session.authenticate(keys.keys(), options_.auth_timeout, callback_);

    transition(RunState::EXECUTING, "Running " + cmd.command);
    auto channel = session.open_exec(cmd.command, options_.connect_timeout);
    StreamRelay relay(*channel, options_.streams);
    return relay.run(options_.exec_timeout);
}
