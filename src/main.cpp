#include <iostream>
#include <vector>
#include <string>
#include <csignal>
#include "cli/sshrun_cli.hpp"
#include "cli/theme.hpp"
#include "core/log.hpp"

int main(int argc, char** argv) {
    // A closed stdout surfaces as a write error instead of killing us
    std::signal(SIGPIPE, SIG_IGN);

    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        auto parsed = parse_cli_args(args);
        if (parsed.is_err()) {
            std::cerr << theme::fail(parsed.error);
            print_usage(std::cerr);
            return 1;
        }

        SSHRunCLI cli;
        return cli.run(parsed.value);
    } catch (const std::exception& e) {
        log_debug(std::string("Fatal: ") + e.what());
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
