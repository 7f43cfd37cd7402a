#include "known_hosts.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <fstream>

// ── Key types ────────────────────────────────────────────────────────

struct KeyTypeInfo {
    int hostkey_type;
    int knownhost_mask;
    const char* name;
};

static const KeyTypeInfo KEY_TYPES[] = {
    {LIBSSH2_HOSTKEY_TYPE_RSA,       LIBSSH2_KNOWNHOST_KEY_SSHRSA,    "ssh-rsa"},
    {LIBSSH2_HOSTKEY_TYPE_DSS,       LIBSSH2_KNOWNHOST_KEY_SSHDSS,    "ssh-dss"},
    {LIBSSH2_HOSTKEY_TYPE_ECDSA_256, LIBSSH2_KNOWNHOST_KEY_ECDSA_256, "ecdsa-sha2-nistp256"},
    {LIBSSH2_HOSTKEY_TYPE_ECDSA_384, LIBSSH2_KNOWNHOST_KEY_ECDSA_384, "ecdsa-sha2-nistp384"},
    {LIBSSH2_HOSTKEY_TYPE_ECDSA_521, LIBSSH2_KNOWNHOST_KEY_ECDSA_521, "ecdsa-sha2-nistp521"},
    {LIBSSH2_HOSTKEY_TYPE_ED25519,   LIBSSH2_KNOWNHOST_KEY_ED25519,   "ssh-ed25519"},
};

static const KeyTypeInfo* find_key_type(int hostkey_type) {
    for (const auto& info : KEY_TYPES) {
        if (info.hostkey_type == hostkey_type) return &info;
    }
    return nullptr;
}

static int knownhost_typemask(const HostKey& key) {
    const KeyTypeInfo* info = find_key_type(key.type);
    int mask = info ? info->knownhost_mask : LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    return LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | mask;
}

std::string HostKey::type_name() const {
    const KeyTypeInfo* info = find_key_type(type);
    return info ? info->name : "unknown";
}

std::string known_host_name(const std::string& host, int port) {
    if (port == 22) return host;
    return fmt::format("[{}]:{}", host, port);
}

// ── KnownHostsStore ──────────────────────────────────────────────────

void KnownHostsStore::Deleter::operator()(LIBSSH2_KNOWNHOSTS* hosts) const {
    libssh2_knownhost_free(hosts);
}

KnownHostsStore::KnownHostsStore(LIBSSH2_SESSION* session, fs::path path)
    : hosts_(session ? libssh2_knownhost_init(session) : nullptr), path_(std::move(path)) {
}

KnownHostsStore::~KnownHostsStore() = default;

Result<void> KnownHostsStore::load() {
    if (!hosts_) {
        return Result<void>::Err("Failed to initialize known hosts store");
    }

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        log_debug(fmt::format("Known hosts file {} does not exist yet", path_.string()));
        return Result<void>::Ok();
    }

    int n = libssh2_knownhost_readfile(hosts_.get(), path_.c_str(),
                                       LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    if (n < 0) {
        return Result<void>::Err(fmt::format(
            "Failed to parse known hosts file {} (error {})", path_.string(), n));
    }

    log_debug(fmt::format("Loaded {} known host entries from {}", n, path_.string()));
    return Result<void>::Ok();
}

Result<HostKeyCheck> KnownHostsStore::check(const std::string& host, int port,
                                            const HostKey& key) const {
    if (!hosts_) {
        return Result<HostKeyCheck>::Err("Failed to initialize known hosts store");
    }

    struct libssh2_knownhost* known = nullptr;
    int rc = libssh2_knownhost_checkp(hosts_.get(), host.c_str(), port,
                                      key.blob.data(), key.blob.size(),
                                      knownhost_typemask(key), &known);
    switch (rc) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return Result<HostKeyCheck>::Ok(HostKeyCheck::MATCH);
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return Result<HostKeyCheck>::Ok(HostKeyCheck::MISMATCH);
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        return Result<HostKeyCheck>::Ok(HostKeyCheck::NOT_FOUND);
    default:
        return Result<HostKeyCheck>::Err(fmt::format(
            "Known hosts check failed for {}", known_host_name(host, port)));
    }
}

Result<void> KnownHostsStore::add(const std::string& host, int port, const HostKey& key,
                                  const std::string& comment) {
    if (!hosts_) {
        return Result<void>::Err("Failed to initialize known hosts store");
    }

    std::string name = known_host_name(host, port);
    struct libssh2_knownhost* entry = nullptr;
    int rc = libssh2_knownhost_addc(hosts_.get(), name.c_str(), nullptr,
                                    key.blob.data(), key.blob.size(),
                                    comment.empty() ? nullptr : comment.c_str(),
                                    comment.size(),
                                    knownhost_typemask(key), &entry);
    if (rc != 0 || !entry) {
        return Result<void>::Err(fmt::format("Failed to record host key for {}", name));
    }

    char line[8192];
    size_t line_len = 0;
    rc = libssh2_knownhost_writeline(hosts_.get(), entry, line, sizeof(line), &line_len,
                                     LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    if (rc != 0) {
        return Result<void>::Err(fmt::format("Failed to format known hosts line for {}", name));
    }

    std::error_code ec;
    fs::path dir = path_.parent_path();
    if (!dir.empty() && !fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            return Result<void>::Err(fmt::format("Failed to create {}: {}", dir.string(), ec.message()));
        }
        fs::permissions(dir, fs::perms::owner_all, ec);
    }

    // Don't glue the new entry onto an unterminated last line
    bool needs_newline = false;
    {
        std::ifstream in(path_, std::ios::binary | std::ios::ate);
        if (in && in.tellg() > 0) {
            in.seekg(-1, std::ios::end);
            char last = 0;
            in.get(last);
            needs_newline = (last != '\n');
        }
    }

    std::ofstream out(path_, std::ios::app | std::ios::binary);
    if (!out) {
        return Result<void>::Err(fmt::format("Failed to open {} for writing", path_.string()));
    }
    if (needs_newline) out << '\n';
    out.write(line, static_cast<std::streamsize>(line_len));
    if (line_len == 0 || line[line_len - 1] != '\n') out << '\n';
    if (!out) {
        return Result<void>::Err(fmt::format("Failed to write {}", path_.string()));
    }

    log_debug(fmt::format("Added {} key for {} to {}", key.type_name(), name, path_.string()));
    return Result<void>::Ok();
}

// ── Verification ─────────────────────────────────────────────────────

UnknownKeyPolicy unknown_key_policy(bool strict) {
    return [strict](const std::string& remote, const HostKey& key) {
        log_warn(fmt::format("Unknown host key for {} ({})", remote, key.type_name()));
        return !strict;
    };
}

HostKeyVerifier::HostKeyVerifier(KnownHostsStore& store, UnknownKeyPolicy policy)
    : store_(store), policy_(std::move(policy)) {
}

Result<void> HostKeyVerifier::verify(const std::string& host, int port, const HostKey& key) {
    std::string remote = fmt::format("{}:{}", host, port);

    auto check = store_.check(host, port, key);
    if (check.is_err()) {
        return Result<void>::Err(check.error);
    }

    switch (check.value) {
    case HostKeyCheck::MATCH:
        log_debug(fmt::format("Host key for {} matches {}", remote, store_.path().string()));
        return Result<void>::Ok();

    case HostKeyCheck::MISMATCH:
        return Result<void>::Err(fmt::format(
            "Host key for {} does not match the one recorded in {}. "
            "Remove the entry for {} to accept the new key.",
            remote, store_.path().string(), known_host_name(host, port)));

    case HostKeyCheck::NOT_FOUND:
        break;
    }

    if (!policy_ || !policy_(remote, key)) {
        return Result<void>::Err(fmt::format(
            "Host key for {} is not in {} and strict host key checking is enabled",
            remote, store_.path().string()));
    }

    // Accepted: remember it, but a read-only store doesn't block the connection
    auto added = store_.add(host, port, key);
    if (added.is_err()) {
        log_warn(added.error);
    }
    return Result<void>::Ok();
}
