#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
std::string g_log_path;
bool g_verbose = false;

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()));
}

} // namespace

std::string sshrun_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path.empty()) {
        g_log_path = (platform::temp_dir() / "sshrun_debug.log").string();
    }
    return g_log_path;
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
}

void set_log_verbose(bool verbose) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_verbose = verbose;
}

void sshrun_log(LogLevel level, const std::string& msg) {
    std::string path = sshrun_log_path();
    std::string line = fmt::format("[{}] {:<5} {}", timestamp(), level_tag(level), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    {
        std::ofstream out(path, std::ios::app);
        if (out) out << line << "\n";
    }

    if (level >= LogLevel::WARN || g_verbose) {
        std::cerr << level_tag(level) << ": " << msg << "\n";
    }
}
