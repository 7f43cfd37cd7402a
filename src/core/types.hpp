#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <utility>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH endpoint advertised by the server ("host:port")
struct Endpoint {
    std::string host;
    int port = 22;

    std::string to_string() const {
        return host + ":" + std::to_string(port);
    }
};

// Ordered name/value pairs applied to the SSH session before handshake
using PropertyList = std::vector<std::pair<std::string, std::string>>;

// Configuration structures
struct ClientConfig {
    std::string url;
    std::string user;
    std::vector<std::string> identity_files;
    bool strict_host_key = false;
    std::string known_hosts;
    int connect_timeout = 30;                    // seconds
    int auth_timeout = 10;                       // seconds
    int exec_timeout = 0;                        // seconds, 0 = wait forever
    PropertyList ssh_properties;                 // defaults, before -sshprop
    std::string log_file;
    bool verbose = false;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
