#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Remote command plus the session properties pulled out of the arguments.
struct CommandLine {
    std::string command;
    PropertyList properties;
};

// Walk args once, left to right. "-sshprop key=value" pairs (key non-empty)
// go to properties; every other argument is quoted and joined with spaces.
CommandLine build_command(const std::vector<std::string>& args);
