#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <core/types.hpp>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

struct SpawnOptions {
    std::filesystem::path cwd;                  // empty = inherit
    std::map<std::string, std::string> env;     // added to the inherited environment
    bool capture_output = false;                // pipe stdout/stderr back to the parent
    bool new_process_group = false;             // child leads its own group, terminate() kills the tree
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code (128+signal when killed).
    // timeout_ms = -1 means indefinite wait; -1 is returned on timeout.
    int wait(int timeout_ms = -1);

    // Terminate the process, or its whole group when spawned with
    // new_process_group (SIGTERM then SIGKILL on Unix, job object on Windows).
    void terminate();

    // Reason the spawn failed, empty when valid().
    const std::string& spawn_error() const { return spawn_error_; }

    // Get the raw pid/handle.
#ifdef _WIN32
    HANDLE native_handle() const { return handle_; }
#else
    int native_handle() const { return pid_; }
#endif

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
    HANDLE job_ = nullptr;
    HANDLE stdout_read_ = INVALID_HANDLE_VALUE;
    HANDLE stderr_read_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool group_ = false;
#endif
    bool reaped_ = false;
    int exit_code_ = -1;
    std::string spawn_error_;

    void close_pipes();
    bool try_reap(bool block);

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& options);
    friend ProcessResult run_captured(const std::string& program,
                                      const std::vector<std::string>& args,
                                      const SpawnOptions& options,
                                      int timeout_ms);
};

// Spawn a child process. program is looked up on PATH.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options = {});

// Run a program to completion, capturing stdout/stderr.
// On expiry of timeout_ms the child (and its group) is terminated and
// timed_out is set. timeout_ms < 0 waits indefinitely.
ProcessResult run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           const SpawnOptions& options = {},
                           int timeout_ms = -1);

// Run a command line through the platform shell (/bin/sh -c, cmd /C).
ProcessResult run_shell(const std::string& command,
                        const SpawnOptions& options = {},
                        int timeout_ms = -1);

} // namespace platform
