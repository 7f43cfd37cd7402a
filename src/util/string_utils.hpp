#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::string trim(const std::string& str);

// Case-insensitive ASCII comparison (HTTP header names).
bool iequals(const std::string& a, const std::string& b);

// Quote one argument for the remote command line. Arguments made only of
// [A-Za-z0-9_@%+=:,./-] pass through; anything else (including the empty
// string) is wrapped in double quotes with " \ $ ` and control characters
// backslash-escaped.
std::string quote_argument(const std::string& arg);

// Quote each argument and join with single spaces.
std::string join_quoted(const std::vector<std::string>& args);

// Inverse of join_quoted: split on unquoted whitespace, honoring
// double quotes (with backslash escapes) and single quotes (literal).
std::vector<std::string> tokenize_quoted(const std::string& command);
}
