#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file. A missing file yields the defaults.
    static Result<Config> load(const fs::path& path);

    // Load ~/.sshrun/config.yaml
    static Result<Config> load_global();

    // Parse YAML text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    // SSHRUN_URL / SSHRUN_USER override whatever the file said
    void apply_environment();

    const ClientConfig& client() const { return client_; }
    ClientConfig& client() { return client_; }

public:
    Config() = default;

private:
    ClientConfig client_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
