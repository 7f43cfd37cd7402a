#pragma once

#include <stdexcept>
#include <string>

// Network, protocol, host-key or authentication failure.
class SSHIOError : public std::runtime_error {
public:
    explicit SSHIOError(const std::string& msg) : std::runtime_error(msg) {}
};

// A deadline (authentication or remote completion) passed.
class SSHTimeoutError : public SSHIOError {
public:
    explicit SSHTimeoutError(const std::string& msg) : SSHIOError(msg) {}
};
