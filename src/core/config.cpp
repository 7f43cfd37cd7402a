#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <stdexcept>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sshrun";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

static std::string expand_path(const std::string& value) {
    if (value.empty()) return value;
    return expand_home(value).string();
}

// min is 0 for exec_timeout (0 = no deadline) and 1 for the others
static int parse_timeout(const YAML::Node& node, const char* key, int fallback, int min) {
    if (!node[key]) return fallback;
    int value = node[key].as<int>();
    if (value < min) {
        throw std::runtime_error(fmt::format("'{}' must be at least {} (got {})", key, min, value));
    }
    return value;
}

static ClientConfig parse_client_config(const YAML::Node& root) {
    ClientConfig client;
    client.url = root["url"].as<std::string>("");
    client.user = root["user"].as<std::string>("");
    client.strict_host_key = root["strict_host_key"].as<bool>(false);
    client.known_hosts = expand_path(root["known_hosts"].as<std::string>(""));
    client.connect_timeout = parse_timeout(root, "connect_timeout", client.connect_timeout, 1);
    client.auth_timeout = parse_timeout(root, "auth_timeout", client.auth_timeout, 1);
    client.exec_timeout = parse_timeout(root, "exec_timeout", client.exec_timeout, 0);
    client.log_file = expand_path(root["log_file"].as<std::string>(""));
    client.verbose = root["verbose"].as<bool>(false);

    // identity_files: a list, or a single path
    if (root["identity_files"]) {
        const auto& ids = root["identity_files"];
        if (ids.IsSequence()) {
            for (const auto& id : ids) {
                client.identity_files.push_back(expand_path(id.as<std::string>()));
            }
        } else if (ids.IsScalar()) {
            client.identity_files.push_back(expand_path(ids.as<std::string>()));
        }
    }

    if (root["ssh_properties"]) {
        if (!root["ssh_properties"].IsMap()) {
            throw std::runtime_error("'ssh_properties' must be a map of name: value");
        }
        for (const auto& kv : root["ssh_properties"]) {
            client.ssh_properties.emplace_back(kv.first.as<std::string>(),
                                               kv.second.as<std::string>(""));
        }
    }

    return client;
}

// Null document = defaults; anything but a map is an error
static Result<Config> config_from_root(const YAML::Node& root, const std::string& source) {
    Config config;
    if (root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err(source + ": config must be a YAML map");
    }
    config.client() = parse_client_config(root);
    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return config_from_root(YAML::Load(yaml_text), "<text>");
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    try {
        return config_from_root(YAML::LoadFile(path.string()), path.string());
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load_global() {
    return load(get_global_config_path());
}

void Config::apply_environment() {
    if (const char* url = std::getenv(ENV_URL)) {
        if (*url) client_.url = url;
    }
    if (const char* user = std::getenv(ENV_USER)) {
        if (*user) client_.user = user;
    }
}
