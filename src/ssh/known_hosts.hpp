#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_KNOWNHOSTS LIBSSH2_KNOWNHOSTS;

// Server public key as returned by libssh2_session_hostkey()
struct HostKey {
    std::string blob;   // raw key, SSH wire format
    int type = 0;       // LIBSSH2_HOSTKEY_TYPE_*

    // "ssh-ed25519", "ssh-rsa", ... ("unknown" if not recognized)
    std::string type_name() const;
};

// Name a host is recorded under: "host" on port 22, "[host]:port" otherwise.
std::string known_host_name(const std::string& host, int port);

enum class HostKeyCheck {
    MATCH,       // Recorded and identical
    MISMATCH,    // Recorded with a different key of the same type
    NOT_FOUND,   // No record for this host and key type
};

// OpenSSH-format known_hosts file backed by libssh2's knownhost API.
// New entries are appended to the file, existing lines are never rewritten.
class KnownHostsStore {
public:
    KnownHostsStore(LIBSSH2_SESSION* session, fs::path path);
    ~KnownHostsStore();

    KnownHostsStore(const KnownHostsStore&) = delete;
    KnownHostsStore& operator=(const KnownHostsStore&) = delete;

    // Read the file. A missing file is an empty store.
    Result<void> load();

    Result<HostKeyCheck> check(const std::string& host, int port, const HostKey& key) const;

    // Record the key in memory and append it to the file.
    Result<void> add(const std::string& host, int port, const HostKey& key,
                     const std::string& comment = "");

    const fs::path& path() const { return path_; }

private:
    struct Deleter {
        void operator()(LIBSSH2_KNOWNHOSTS* hosts) const;
    };

    std::unique_ptr<LIBSSH2_KNOWNHOSTS, Deleter> hosts_;
    fs::path path_;
};

// Decides whether to trust a host key that has no known_hosts record.
// remote is "host:port".
using UnknownKeyPolicy = std::function<bool(const std::string& remote, const HostKey& key)>;

// Logs a warning for the unknown key and returns !strict.
UnknownKeyPolicy unknown_key_policy(bool strict);

// Trust-on-first-use verification: known keys must match, unknown keys are
// referred to the policy and remembered when accepted.
class HostKeyVerifier {
public:
    HostKeyVerifier(KnownHostsStore& store, UnknownKeyPolicy policy);

    Result<void> verify(const std::string& host, int port, const HostKey& key);

private:
    KnownHostsStore& store_;
    UnknownKeyPolicy policy_;
};
