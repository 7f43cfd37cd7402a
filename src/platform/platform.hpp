#pragma once

#include <string>
#include <cstddef>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Unique, not-yet-existing path under temp_dir() starting with prefix.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Write the whole buffer to fd, retrying on EINTR/EAGAIN.
// Returns false on a hard write error.
bool write_all(int fd, const char* data, size_t len);

// True if fd refers to an open descriptor.
bool fd_is_open(int fd);

// Name of the local user (for the default SSH login name).
std::string current_user();

} // namespace platform
