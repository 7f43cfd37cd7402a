#include "utils.hpp"
#include <platform/platform.hpp>
#include <util/string_utils.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::optional<int> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    // std::stoi skips leading whitespace and accepts a '+' sign
    if (!std::isdigit(static_cast<unsigned char>(s[0])) && s[0] != '-') {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(const std::string& s) {
    std::string v = to_lower(StringUtils::trim(s));
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

std::filesystem::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.size() > 1 && path[0] == '~' && path[1] == '/') {
        return platform::home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
