#pragma once
#include <string>

// RAII advisory lock on a lock file. Guards a job's state files across
// separate processes. Uses flock() on Unix, LockFileEx() on Windows.
// Lock is automatically released when the process exits (even on crash),
// so a crashed holder never leaves a stale lock behind.
class FileLock {
public:
    // Single non-blocking attempt. Check held() after construction.
    explicit FileLock(const std::string& lock_path);

    // Retries every poll_ms until the lock is acquired or timeout_ms elapses.
    FileLock(const std::string& lock_path, int timeout_ms, int poll_ms);

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    // Releases early; the destructor is then a no-op.
    void release();

private:
    bool try_lock(const std::string& lock_path);

    int fd_ = -1;
};
