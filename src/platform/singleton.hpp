#pragma once
#include <string>

// RAII claim lock. Held by the process that owns an endpoint name.
// Uses flock() on Unix, LockFileEx() on Windows.
// Lock is automatically released when the process exits (even on crash),
// so a stale lock file never blocks the next instance.
class ClaimLock {
public:
    // Attempts to acquire the lock without waiting. Check held() after construction.
    explicit ClaimLock(const std::string& lock_path);
    ~ClaimLock();

    ClaimLock(ClaimLock&& other) noexcept;
    ClaimLock& operator=(ClaimLock&& other) noexcept;
    ClaimLock(const ClaimLock&) = delete;
    ClaimLock& operator=(const ClaimLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    // Why acquisition failed ("" when held, or when another holder exists).
    const std::string& error() const { return error_; }

    // True when the lock file could be opened but another process holds it.
    bool contended() const { return contended_; }

    const std::string& path() const { return path_; }

private:
    void release();

    int fd_ = -1;
    bool contended_ = false;
    std::string path_;
    std::string error_;
};
