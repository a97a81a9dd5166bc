#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

bool write_file_durable(const fs::path& path, const std::string& data, std::string& error) {
#ifdef _WIN32
    int fd = _open(path.string().c_str(), _O_CREAT | _O_TRUNC | _O_WRONLY | _O_BINARY, 0644);
#else
    int fd = open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
#endif
    if (fd < 0) {
        error = std::strerror(errno);
        return false;
    }

    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
#ifdef _WIN32
        int n = _write(fd, p, static_cast<unsigned>(remaining));
#else
        ssize_t n = write(fd, p, remaining);
#endif
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::strerror(errno);
#ifdef _WIN32
            _close(fd);
#else
            close(fd);
#endif
            return false;
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }

#ifdef _WIN32
    bool synced = _commit(fd) == 0;
    if (!synced) error = std::strerror(errno);
    bool closed = _close(fd) == 0;
#else
    bool synced = fsync(fd) == 0;
    if (!synced) error = std::strerror(errno);
    bool closed = close(fd) == 0;
#endif
    if (synced && !closed) error = std::strerror(errno);
    return synced && closed;
}

bool sync_dir(const fs::path& dir) {
#ifdef _WIN32
    (void)dir;
    return true;
#else
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = fsync(fd) == 0;
    close(fd);
    return ok;
#endif
}

} // namespace platform
