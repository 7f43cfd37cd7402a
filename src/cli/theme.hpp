#pragma once

#include <string>
#include <fmt/format.h>

// Status lines go to stderr; stdout belongs to the remote command.
namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// Section header
inline std::string section(const std::string& title) {
    return color::BROWN + color::BOLD + title + color::RESET + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "x " + color::RESET + msg + "\n";
}

// Subtle log line for connection progress
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m\xc2\xb7 " + msg + "\033[0m\n";
}

// Option row for the usage text
inline std::string kv(const std::string& key, const std::string& value) {
    return color::BLUE + fmt::format("  {:<22}", key) + color::RESET + color::DIM + value +
           color::RESET + "\n";
}

} // namespace theme
