#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <pwd.h>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    if (const struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir && *pw->pw_dir) return fs::path(pw->pw_dir);
    }
    return temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    std::string pattern = (temp_dir() / (prefix + "_XXXXXX")).string();
    int fd = mkstemp(pattern.data());
    if (fd < 0) {
        throw std::runtime_error("Cannot create temp file " + pattern + ": " +
                                 std::strerror(errno));
    }
    close(fd);
    return fs::path(pattern);
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
