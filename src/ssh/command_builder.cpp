#include "command_builder.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>

CommandLine build_command(const std::vector<std::string>& args) {
    CommandLine result;
    std::vector<std::string> remaining;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == SSH_PROPERTY_FLAG && i + 1 < args.size()) {
            const std::string& pair = args[i + 1];
            auto eq = pair.find('=');
            if (eq != std::string::npos && eq >= 1) {
                result.properties.emplace_back(pair.substr(0, eq), pair.substr(eq + 1));
                i++;
                continue;
            }
        }
        remaining.push_back(args[i]);
    }

    result.command = StringUtils::join_quoted(remaining);
    return result;
}
