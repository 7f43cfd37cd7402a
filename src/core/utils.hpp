#pragma once

#include <string>
#include <optional>
#include <filesystem>

// Strict integer parse: the whole string must be a decimal integer.
std::optional<int> parse_int(const std::string& s);

// Parse yes/no style booleans ("true", "yes", "on", "1" and their negatives).
std::optional<bool> parse_bool(const std::string& s);

// Expand a leading "~" to the user's home directory.
std::filesystem::path expand_home(const std::string& path);

// Lowercase ASCII copy.
std::string to_lower(std::string s);
