#include "singleton.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#  include <sys/stat.h>
#else
#  include <sys/file.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

ClaimLock::ClaimLock(const std::string& lock_path) : path_(lock_path) {
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path(), ec);

#ifdef _WIN32
    fd_ = _open(lock_path.c_str(), _O_CREAT | _O_RDWR | _O_NOINHERIT, _S_IREAD | _S_IWRITE);
    if (fd_ < 0) {
        error_ = std::strerror(errno);
        return;
    }
    HANDLE h = (HANDLE)_get_osfhandle(fd_);
    OVERLAPPED ov = {};
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                    0, 1, 0, &ov)) {
        contended_ = GetLastError() == ERROR_LOCK_VIOLATION;
        _close(fd_);
        fd_ = -1;
    }
#else
    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        error_ = std::strerror(errno);
        return;
    }
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        contended_ = (errno == EWOULDBLOCK);
        if (!contended_) error_ = std::strerror(errno);
        close(fd_);
        fd_ = -1;
    }
#endif
}

ClaimLock::~ClaimLock() {
    release();
}

ClaimLock::ClaimLock(ClaimLock&& other) noexcept
    : fd_(other.fd_),
      contended_(other.contended_),
      path_(std::move(other.path_)),
      error_(std::move(other.error_)) {
    other.fd_ = -1;
}

ClaimLock& ClaimLock::operator=(ClaimLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        contended_ = other.contended_;
        path_ = std::move(other.path_);
        error_ = std::move(other.error_);
        other.fd_ = -1;
    }
    return *this;
}

// The lock file itself stays on disk: unlinking it while another process
// has it open would let two holders lock different inodes.
void ClaimLock::release() {
    if (fd_ < 0) return;
#ifdef _WIN32
    _close(fd_);
#else
    close(fd_);
#endif
    fd_ = -1;
}
