#include "keys.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <fstream>
#include <unistd.h>

static const char* DEFAULT_KEY_NAMES[] = {"id_ed25519", "id_ecdsa", "id_rsa", "id_dsa"};

std::string KeyPair::algorithm() const {
    if (public_key) {
        std::ifstream in(*public_key);
        std::string type;
        if (in >> type && !type.empty()) return type;
    }
    return "unknown";
}

Result<void> KeyProvider::add_file(const fs::path& private_key, const std::string& passphrase) {
    std::error_code ec;
    if (!fs::is_regular_file(private_key, ec)) {
        return Result<void>::Err(fmt::format("Key file not found: {}", private_key.string()));
    }
    if (access(private_key.c_str(), R_OK) != 0) {
        return Result<void>::Err(fmt::format("Key file is not readable: {}", private_key.string()));
    }

    KeyPair pair;
    pair.private_key = private_key;
    pair.passphrase = passphrase;

    fs::path pub = private_key;
    pub += ".pub";
    if (fs::is_regular_file(pub, ec)) {
        pair.public_key = pub;
    }

    log_debug(fmt::format("Loaded identity {} ({})", private_key.string(), pair.algorithm()));
    keys_.push_back(std::move(pair));
    return Result<void>::Ok();
}

size_t KeyProvider::add_defaults(const fs::path& ssh_dir, const std::string& passphrase) {
    size_t added = 0;
    for (const char* name : DEFAULT_KEY_NAMES) {
        fs::path candidate = ssh_dir / name;
        std::error_code ec;
        if (!fs::exists(candidate, ec)) continue;

        auto r = add_file(candidate, passphrase);
        if (r.is_err()) {
            log_warn(r.error);
            continue;
        }
        added++;
    }
    return added;
}
