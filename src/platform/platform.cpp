#include "platform.hpp"
#include <cstdlib>
#include <cerrno>
#include <ctime>
#include <random>
#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    // pid + random for uniqueness across parallel test runs
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    fs::path p;
    do {
        p = temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                          std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

bool write_all(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w = ::write(fd, data + sent, len - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfd = {fd, POLLOUT, 0};
                poll(&pfd, 1, 100);
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(w);
    }
    return true;
}

bool fd_is_open(int fd) {
    return fcntl(fd, F_GETFD) != -1;
}

std::string current_user() {
    const char* user = std::getenv("USER");
    if (user && *user) return user;

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) return pw->pw_name;
    return "";
}

} // namespace platform
