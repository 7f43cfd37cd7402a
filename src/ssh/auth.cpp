#include "auth.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

const KeyPair& authenticate_with_keys(const std::vector<KeyPair>& keys,
                                      const KeyAttempt& attempt,
                                      std::chrono::milliseconds timeout,
                                      const PendingWait& wait) {
    if (keys.empty()) {
        throw SSHIOError("No private keys available for public-key authentication");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::string> rejected;

    for (const auto& key : keys) {
        log_debug(fmt::format("Offering {} private key {}", key.algorithm(), key.private_key.string()));

        while (true) {
            AuthAttempt result = attempt(key);

            if (result.outcome == AuthOutcome::ACCEPTED) {
                log_debug(fmt::format("Authenticated with {}", key.private_key.string()));
                return key;
            }
            if (result.outcome == AuthOutcome::FAILED) {
                throw SSHIOError("Authentication failed: " + result.detail);
            }
            if (result.outcome == AuthOutcome::REJECTED) {
                log_debug(fmt::format("Key {} rejected: {}", key.private_key.string(), result.detail));
                rejected.push_back(key.private_key.filename().string());
                break;
            }

            // PENDING
            bool in_time = std::chrono::steady_clock::now() < deadline;
            if (in_time) {
                if (wait) {
                    in_time = wait(deadline);
                } else {
                    platform::sleep_ms(SSH_RETRY_SLEEP_MS);
                }
            }
            if (!in_time) {
                throw SSHTimeoutError(fmt::format(
                    "Authentication did not complete within {} ms", timeout.count()));
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            throw SSHTimeoutError(fmt::format(
                "Authentication did not complete within {} ms", timeout.count()));
        }
    }

    throw SSHIOError(fmt::format("Authentication failed: server rejected all {} key(s) ({})",
                                 keys.size(), fmt::join(rejected, ", ")));
}

static std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown error";
}

KeyAttempt libssh2_key_attempt(LIBSSH2_SESSION* session, const std::string& user) {
    return [session, user](const KeyPair& key) -> AuthAttempt {
        std::string pub = key.public_key ? key.public_key->string() : "";
        std::string priv = key.private_key.string();

        int rc = libssh2_userauth_publickey_fromfile_ex(
            session, user.c_str(), static_cast<unsigned int>(user.size()),
            pub.empty() ? nullptr : pub.c_str(), priv.c_str(),
            key.passphrase.empty() ? nullptr : key.passphrase.c_str());

        switch (rc) {
        case 0:
            return {AuthOutcome::ACCEPTED, ""};
        case LIBSSH2_ERROR_EAGAIN:
            return {AuthOutcome::PENDING, ""};
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_TIMEOUT:
            return {AuthOutcome::FAILED, last_error(session)};
        default:
            return {AuthOutcome::REJECTED, last_error(session)};
        }
    };
}
