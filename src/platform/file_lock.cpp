#include "file_lock.hpp"
#include "platform.hpp"
#include <chrono>
#include <filesystem>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <sys/file.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

FileLock::FileLock(const std::string& lock_path) {
    try_lock(lock_path);
}

FileLock::FileLock(const std::string& lock_path, int timeout_ms, int poll_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!try_lock(lock_path)) {
        if (std::chrono::steady_clock::now() >= deadline) return;
        platform::sleep_ms(poll_ms > 0 ? poll_ms : 1);
    }
}

FileLock::~FileLock() {
    release();
}

bool FileLock::try_lock(const std::string& lock_path) {
    // Ensure parent directory exists
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path(), ec);

#ifdef _WIN32
    fd_ = _open(lock_path.c_str(), _O_CREAT | _O_RDWR, 0644);
    if (fd_ < 0) return false;
    HANDLE h = (HANDLE)_get_osfhandle(fd_);
    OVERLAPPED ov = {};
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                    0, 1, 0, &ov)) {
        _close(fd_);
        fd_ = -1;
    }
#else
    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) return false;
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        close(fd_);
        fd_ = -1;
    }
#endif
    return fd_ >= 0;
}

void FileLock::release() {
    if (fd_ < 0) return;
#ifdef _WIN32
    _close(fd_);
#else
    close(fd_);
#endif
    fd_ = -1;
    // flock is released automatically when fd is closed
}
