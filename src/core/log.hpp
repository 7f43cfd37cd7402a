#pragma once

#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

// Debug log path: <tmp>/sshrun_debug.log unless overridden.
std::string sshrun_log_path();
void set_log_path(const std::string& path);

// Echo debug/info lines to stderr as well (warnings always go there).
void set_log_verbose(bool verbose);

// Append a timestamped line to the log file.
void sshrun_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { sshrun_log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg)  { sshrun_log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg)  { sshrun_log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) { sshrun_log(LogLevel::ERROR, msg); }

