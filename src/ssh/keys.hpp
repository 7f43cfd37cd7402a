#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

// One identity offered during public-key authentication.
struct KeyPair {
    fs::path private_key;
    std::optional<fs::path> public_key;   // "<private>.pub" when present
    std::string passphrase;

    // Key algorithm from the public key file ("ssh-ed25519", ...), or "unknown".
    std::string algorithm() const;
};

// Ordered collection of identities. Keys are offered in insertion order.
class KeyProvider {
public:
    // Add a private key file. Fails if the file is missing or unreadable.
    Result<void> add_file(const fs::path& private_key, const std::string& passphrase = "");

    // Add whichever of id_ed25519, id_ecdsa, id_rsa, id_dsa exist in ssh_dir.
    // Returns the number of keys added.
    size_t add_defaults(const fs::path& ssh_dir, const std::string& passphrase = "");

    const std::vector<KeyPair>& keys() const { return keys_; }
    bool empty() const { return keys_.empty(); }

private:
    std::vector<KeyPair> keys_;
};
