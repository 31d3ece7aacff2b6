#pragma once
#include <string>
#include <memory>
#include <core/types.hpp>

// RAII advisory lock scoped to one repository. Serializes add/remove runs.
// Uses flock() on Unix, LockFileEx() on Windows.
// Lock is automatically released when the process exits (even on crash).
class RepositoryLock {
public:
    enum class Mode {
        Block,      // poll until acquired or timeout expires
        FailFast,   // single attempt
    };

    // Attempts to acquire the lock. Check held() after construction.
    // timeout_ms only applies to Mode::Block; 0 waits forever.
    RepositoryLock(const std::string& lock_path, Mode mode, int timeout_ms = 0);
    ~RepositoryLock();

    RepositoryLock(const RepositoryLock&) = delete;
    RepositoryLock& operator=(const RepositoryLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    // True if a Block-mode acquisition had to wait for another holder.
    bool waited() const { return waited_; }

    const std::string& path() const { return path_; }

    // Set when the lock file itself could not be opened.
    const std::string& open_error() const { return open_error_; }

    // Acquire or fail with ErrorKind::LockAcquisition.
    static Result<std::unique_ptr<RepositoryLock>> acquire(const std::string& lock_path,
                                                           Mode mode, int timeout_ms = 0);

private:
    int fd_ = -1;
    bool waited_ = false;
    std::string path_;
    std::string open_error_;

    bool try_lock();
};
