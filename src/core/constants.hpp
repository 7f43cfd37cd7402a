#pragma once

// ── Endpoint discovery ──────────────────────────────────────
constexpr const char* SSH_ENDPOINT_HEADER = "X-SSH-Endpoint";
constexpr const char* LOGIN_PATH          = "login";
constexpr int SSH_ENDPOINT_UNAVAILABLE    = -1;    // run() result when no header is advertised

// ── Command line ────────────────────────────────────────────
constexpr const char* SSH_PROPERTY_FLAG = "-sshprop";

// ── Timeouts ────────────────────────────────────────────────
constexpr int HTTP_TIMEOUT_SECS          = 30;    // Max time for the discovery request
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake
constexpr int SSH_AUTH_TIMEOUT_SECS      = 10;    // All keys together
constexpr int SSH_EXEC_TIMEOUT_SECS      = 0;     // 0 = wait for the remote command forever
constexpr int SSH_RETRY_SLEEP_MS         = 10;    // Sleep between EAGAIN retries
constexpr int RELAY_POLL_MS              = 100;   // poll() slice in the stream relay

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_URL            = "SSHRUN_URL";
constexpr const char* ENV_USER           = "SSHRUN_USER";
constexpr const char* ENV_KEY_PASSPHRASE = "SSHRUN_KEY_PASSPHRASE";
