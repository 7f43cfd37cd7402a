#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "keys.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Outcome of one non-blocking public-key attempt
enum class AuthOutcome {
    ACCEPTED,   // Server accepted the key; authentication is done
    REJECTED,   // Server refused this key; move on to the next one
    PENDING,    // Would block; call again
    FAILED,     // Transport error; authentication cannot continue
};

struct AuthAttempt {
    AuthOutcome outcome;
    std::string detail;
};

// Offers one key to the server. Called repeatedly while it returns PENDING.
using KeyAttempt = std::function<AuthAttempt(const KeyPair&)>;

// Blocks until the transport can make progress on a PENDING attempt.
// Returns false once the deadline has passed.
using PendingWait = std::function<bool(std::chrono::steady_clock::time_point deadline)>;

// Offer every key in order until one is accepted. Between PENDING attempts
// wait is called; without one the loop sleeps briefly.
//
// Throws SSHTimeoutError if no key is accepted before the deadline, and
// SSHIOError if every key is rejected, no keys are given, or an attempt fails.
// Returns the accepted key.
const KeyPair& authenticate_with_keys(const std::vector<KeyPair>& keys,
                                      const KeyAttempt& attempt,
                                      std::chrono::milliseconds timeout,
                                      const PendingWait& wait = nullptr);

// KeyAttempt backed by libssh2_userauth_publickey_fromfile on a
// non-blocking session.
KeyAttempt libssh2_key_attempt(LIBSSH2_SESSION* session, const std::string& user);
