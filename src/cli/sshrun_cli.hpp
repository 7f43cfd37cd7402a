#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

constexpr const char* SSHRUN_VERSION = "1.0.0";

// Process exit code when the server advertises no SSH endpoint
constexpr int EXIT_ENDPOINT_UNAVAILABLE = 255;

struct CliOptions {
    std::optional<std::string> url;
    std::optional<std::string> user;
    std::vector<std::string> identity_files;
    bool strict_host_key = false;
    std::optional<int> auth_timeout;
    std::optional<int> exec_timeout;
    std::string config_path;         // empty = ~/.sshrun/config.yaml
    bool verbose = false;
    bool show_version = false;
    bool show_help = false;
    std::vector<std::string> command;
};

// Options stop at the first non-option token or at "--"; the rest is the
// remote command, including any -sshprop pairs.
Result<CliOptions> parse_cli_args(const std::vector<std::string>& args);

// File config + environment + flags, in increasing precedence.
ClientConfig merge_cli_options(const Config& file_config, const CliOptions& opts);

void print_usage(std::ostream& out);

class SSHRunCLI {
public:
    // Returns the process exit code. Throws on connection or auth failure.
    int run(const CliOptions& opts);
};
