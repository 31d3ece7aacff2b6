#include "repo_lock.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <chrono>
#include <system_error>
#include <cerrno>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <sys/file.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

RepositoryLock::RepositoryLock(const std::string& lock_path, Mode mode, int timeout_ms)
    : path_(lock_path) {
    // Ensure parent directory exists
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path(), ec);

#ifdef _WIN32
    fd_ = _open(lock_path.c_str(), _O_CREAT | _O_RDWR, 0644);
#else
    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
#endif
    if (fd_ < 0) {
        open_error_ = std::system_category().message(errno);
        return;
    }

    if (try_lock()) return;

    if (mode == Mode::FailFast) {
#ifdef _WIN32
        _close(fd_);
#else
        close(fd_);
#endif
        fd_ = -1;
        return;
    }

    waited_ = true;
    auto start = std::chrono::steady_clock::now();
    while (true) {
        platform::sleep_ms(LOCK_POLL_MS);
        if (try_lock()) return;
        if (timeout_ms > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (elapsed >= timeout_ms) break;
        }
    }

#ifdef _WIN32
    _close(fd_);
#else
    close(fd_);
#endif
    fd_ = -1;
}

bool RepositoryLock::try_lock() {
#ifdef _WIN32
    HANDLE h = (HANDLE)_get_osfhandle(fd_);
    OVERLAPPED ov = {};
    return LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                      0, 1, 0, &ov) != 0;
#else
    return flock(fd_, LOCK_EX | LOCK_NB) == 0;
#endif
}

RepositoryLock::~RepositoryLock() {
    if (fd_ < 0) return;
#ifdef _WIN32
    _close(fd_);
#else
    close(fd_);
#endif
    // flock is released automatically when fd is closed
}

Result<std::unique_ptr<RepositoryLock>> RepositoryLock::acquire(const std::string& lock_path,
                                                                Mode mode, int timeout_ms) {
    auto lock = std::make_unique<RepositoryLock>(lock_path, mode, timeout_ms);
    if (!lock->held()) {
        std::string why = !lock->open_error().empty()
            ? "cannot open lock file: " + lock->open_error()
            : (mode == Mode::FailFast)
            ? "another twin invocation holds the repository lock"
            : fmt::format("timed out after {}ms waiting for the repository lock", timeout_ms);
        twin_log(fmt::format("lock FAILED path={} reason={}", lock_path, why));
        return Result<std::unique_ptr<RepositoryLock>>::Err(
            ErrorKind::LockAcquisition, fmt::format("{} ({})", why, lock_path));
    }
    twin_log(fmt::format("lock acquired path={} waited={}", lock_path, lock->waited()));
    return Result<std::unique_ptr<RepositoryLock>>::Ok(std::move(lock));
}
