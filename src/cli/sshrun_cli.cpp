#include "sshrun_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/client_properties.hpp>
#include <ssh/command_runner.hpp>
#include <ssh/keys.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

// Options that take a value
static bool needs_value(const std::string& opt) {
    return opt == "-s" || opt == "-user" || opt == "-i" || opt == "-authTimeout" ||
           opt == "-execTimeout" || opt == "-config";
}

// 0 is only meaningful where it means "no deadline"
static Result<int> parse_seconds(const std::string& opt, const std::string& value, int min) {
    auto n = parse_int(value);
    if (!n || *n < min) {
        return Result<int>::Err(fmt::format("{} expects a number of seconds >= {}, got '{}'",
                                            opt, min, value));
    }
    return Result<int>::Ok(*n);
}

Result<CliOptions> parse_cli_args(const std::vector<std::string>& args) {
    CliOptions opts;
    size_t i = 0;

    for (; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--") {
            i++;
            break;
        }
        if (arg.empty() || arg[0] != '-' || arg == SSH_PROPERTY_FLAG) {
            break;
        }

        if (needs_value(arg)) {
            if (i + 1 >= args.size()) {
                return Result<CliOptions>::Err("Missing value for " + arg);
            }
            const std::string& value = args[++i];

            if (arg == "-s") {
                opts.url = value;
            } else if (arg == "-user") {
                opts.user = value;
            } else if (arg == "-i") {
                opts.identity_files.push_back(value);
            } else if (arg == "-config") {
                opts.config_path = value;
            } else {
                auto secs = parse_seconds(arg, value, arg == "-authTimeout" ? 1 : 0);
                if (secs.is_err()) return Result<CliOptions>::Err(secs.error);
                if (arg == "-authTimeout") opts.auth_timeout = secs.value;
                else opts.exec_timeout = secs.value;
            }
        } else if (arg == "-strictHostKey") {
            opts.strict_host_key = true;
        } else if (arg == "-v") {
            opts.verbose = true;
        } else if (arg == "-version" || arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-help" || arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else {
            return Result<CliOptions>::Err("Unknown option: " + arg);
        }
    }

    opts.command.assign(args.begin() + static_cast<long>(i), args.end());
    return Result<CliOptions>::Ok(opts);
}

ClientConfig merge_cli_options(const Config& file_config, const CliOptions& opts) {
    ClientConfig client = file_config.client();

    if (opts.url) client.url = *opts.url;
    if (opts.user) client.user = *opts.user;
    if (!opts.identity_files.empty()) {
        client.identity_files.clear();
        for (const auto& id : opts.identity_files) {
            client.identity_files.push_back(expand_home(id).string());
        }
    }
    if (opts.strict_host_key) client.strict_host_key = true;
    if (opts.auth_timeout) client.auth_timeout = *opts.auth_timeout;
    if (opts.exec_timeout) client.exec_timeout = *opts.exec_timeout;
    if (opts.verbose) client.verbose = true;

    if (client.user.empty()) client.user = platform::current_user();
    return client;
}

void print_usage(std::ostream& out) {
    out << theme::bold("sshrun") << theme::dim(fmt::format(" v{}", SSHRUN_VERSION)) << "\n\n";
    out << theme::section("Usage");
    out << "  sshrun [options] command [args...]\n\n";
    out << theme::section("Options");
    out << theme::kv("-s URL", "Server base URL (endpoint from <URL>/login)");
    out << theme::kv("-user NAME", "SSH login name (default: local user)");
    out << theme::kv("-i KEYFILE", "Private key, repeatable (default: ~/.ssh/id_*)");
    out << theme::kv("-strictHostKey", "Refuse hosts missing from known_hosts");
    out << theme::kv("-authTimeout SECONDS", "Authentication deadline (default 10)");
    out << theme::kv("-execTimeout SECONDS", "Remote command deadline (default none)");
    out << theme::kv("-config FILE", "Config file (default ~/.sshrun/config.yaml)");
    out << theme::kv("-v", "Verbose progress and libssh2 trace");
    out << theme::kv("-version", "Show version");
    out << theme::kv("-help", "Show this help");
    out << "\n" << theme::section("Session properties");
    out << theme::dim("  -sshprop NAME=VALUE anywhere in the command. Names:") << "\n  ";
    for (const auto& name : client_property_names()) out << name << " ";
    out << "\n\n" << theme::dim(fmt::format("  Key passphrase is read from ${}.", ENV_KEY_PASSPHRASE)) << "\n";
}

static KeyProvider load_keys(const ClientConfig& client) {
    std::string passphrase;
    if (const char* p = std::getenv(ENV_KEY_PASSPHRASE)) passphrase = p;

    KeyProvider keys;
    if (client.identity_files.empty()) {
        size_t found = keys.add_defaults(platform::home_dir() / ".ssh", passphrase);
        log_debug(fmt::format("Found {} default identity file(s)", found));
    } else {
        for (const auto& id : client.identity_files) {
            auto r = keys.add_file(id, passphrase);
            if (r.is_err()) {
                throw std::runtime_error(r.error);
            }
        }
    }

    if (keys.empty()) {
        throw std::runtime_error("No identity files found (use -i KEYFILE)");
    }
    return keys;
}

int SSHRunCLI::run(const CliOptions& opts) {
    if (opts.show_help) {
        print_usage(std::cout);
        return 0;
    }
    if (opts.show_version) {
        std::cout << "sshrun version " << SSHRUN_VERSION << "\n";
        return 0;
    }

    auto loaded = opts.config_path.empty() ? Config::load_global()
                                           : Config::load(expand_home(opts.config_path));
    if (loaded.is_err()) {
        throw std::runtime_error(loaded.error);
    }
    Config config = loaded.value;
    config.apply_environment();
    ClientConfig client = merge_cli_options(config, opts);

    if (!client.log_file.empty()) set_log_path(client.log_file);
    set_log_verbose(client.verbose);

    if (client.url.empty()) {
        throw std::runtime_error(fmt::format("No server URL (use -s URL or set ${})", ENV_URL));
    }
    if (opts.command.empty()) {
        throw std::runtime_error("No command given (see sshrun -help)");
    }

    KeyProvider keys = load_keys(client);

    RunnerOptions runner_opts;
    runner_opts.known_hosts = client.known_hosts;
    runner_opts.connect_timeout = std::chrono::seconds(client.connect_timeout);
    runner_opts.auth_timeout = std::chrono::seconds(client.auth_timeout);
    runner_opts.exec_timeout = std::chrono::seconds(client.exec_timeout);
    runner_opts.default_properties = client.ssh_properties;
    runner_opts.trace = client.verbose;

    StatusCallback callback = nullptr;
    if (client.verbose) {
        callback = [](const std::string& msg) {
            std::cerr << theme::log(msg);
        };
    }

    SSHCommandRunner runner(runner_opts);
    int status = runner.run(client.url, client.user, opts.command, keys,
                            client.strict_host_key, callback);

    // The resolver has already warned about the missing header
    if (status == SSH_ENDPOINT_UNAVAILABLE) return EXIT_ENDPOINT_UNAVAILABLE;
    return status;
}
