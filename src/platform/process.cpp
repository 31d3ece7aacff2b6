#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#ifdef _WIN32
#  include <windows.h>
#  include <cstring>
#  include <thread>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <cerrno>
#  include <cstring>
#  include <cstdlib>
#endif

#include <chrono>
#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
    if (job_) CloseHandle(job_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    *this = std::move(other);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        if (job_) CloseHandle(job_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        job_ = other.job_;
        stdout_read_ = other.stdout_read_;
        stderr_read_ = other.stderr_read_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
        other.job_ = nullptr;
        other.stdout_read_ = INVALID_HANDLE_VALUE;
        other.stderr_read_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        group_ = other.group_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
#endif
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        spawn_error_ = std::move(other.spawn_error_);
    }
    return *this;
}

void ProcessHandle::close_pipes() {
#ifdef _WIN32
    if (stdout_read_ != INVALID_HANDLE_VALUE) CloseHandle(stdout_read_);
    if (stderr_read_ != INVALID_HANDLE_VALUE) CloseHandle(stderr_read_);
    stdout_read_ = INVALID_HANDLE_VALUE;
    stderr_read_ = INVALID_HANDLE_VALUE;
#else
    if (stdout_fd_ >= 0) close(stdout_fd_);
    if (stderr_fd_ >= 0) close(stderr_fd_);
    stdout_fd_ = -1;
    stderr_fd_ = -1;
#endif
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

bool ProcessHandle::try_reap(bool block) {
    if (reaped_) return true;
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return false;
    if (WaitForSingleObject(handle_, block ? INFINITE : 0) != WAIT_OBJECT_0) return false;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    exit_code_ = static_cast<int>(code);
    reaped_ = true;
    return true;
#else
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (ret < 0 && errno == EINTR);
    if (ret != pid_) return false;

    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
    reaped_ = true;
    return true;
#endif
}

bool ProcessHandle::running() {
    if (!valid()) return false;
    return !try_reap(false);
}

int ProcessHandle::wait(int timeout_ms) {
    if (!valid()) return -1;
    if (timeout_ms < 0) {
        try_reap(true);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (try_reap(false)) return exit_code_;
        sleep_ms(PROCESS_POLL_MS);
        elapsed += PROCESS_POLL_MS;
    }
    return try_reap(false) ? exit_code_ : -1;
}

void ProcessHandle::terminate() {
    if (!valid() || reaped_) return;
#ifdef _WIN32
    if (job_) {
        TerminateJobObject(job_, 1);
    } else {
        TerminateProcess(handle_, 1);
    }
    WaitForSingleObject(handle_, TERMINATE_GRACE_MS);
    try_reap(false);
#else
    pid_t target = group_ ? -pid_ : pid_;
    kill(target, SIGTERM);
    // Wait for graceful exit
    for (int waited = 0; waited < TERMINATE_GRACE_MS; waited += PROCESS_POLL_MS) {
        if (try_reap(false)) {
            // Leader is gone; make sure stragglers in its group follow.
            if (group_) kill(target, SIGKILL);
            return;
        }
        sleep_ms(PROCESS_POLL_MS);
    }
    kill(target, SIGKILL);
    try_reap(true);
#endif
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

static std::string quote_windows_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;
    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            backslashes++;
        } else if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out += '"';
            backslashes = 0;
        } else {
            out.append(backslashes, '\\');
            out += c;
            backslashes = 0;
        }
    }
    out.append(backslashes * 2, '\\');
    out += "\"";
    return out;
}

static std::string build_environment_block(const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> merged;
    LPCH env = GetEnvironmentStringsA();
    if (env) {
        for (LPCH p = env; *p; p += std::strlen(p) + 1) {
            std::string entry(p);
            auto eq = entry.find('=', 1);
            if (eq == std::string::npos) continue;
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        FreeEnvironmentStringsA(env);
    }
    for (const auto& [k, v] : extra) merged[k] = v;

    std::string block;
    for (const auto& [k, v] : merged) {
        block += k + "=" + v;
        block += '\0';
    }
    block += '\0';
    return block;
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Build command line
    std::ostringstream cmdline;
    cmdline << quote_windows_arg(program);
    for (const auto& arg : args) {
        cmdline << " " << quote_windows_arg(arg);
    }
    std::string cmd_str = cmdline.str();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    HANDLE out_write = INVALID_HANDLE_VALUE;
    HANDLE err_write = INVALID_HANDLE_VALUE;
    if (options.capture_output) {
        SECURITY_ATTRIBUTES sa = {};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        if (!CreatePipe(&handle.stdout_read_, &out_write, &sa, 0) ||
            !CreatePipe(&handle.stderr_read_, &err_write, &sa, 0)) {
            handle.spawn_error_ = "CreatePipe failed";
            return handle;
        }
        SetHandleInformation(handle.stdout_read_, HANDLE_FLAG_INHERIT, 0);
        SetHandleInformation(handle.stderr_read_, HANDLE_FLAG_INHERIT, 0);
        si.dwFlags |= STARTF_USESTDHANDLES;
        si.hStdOutput = out_write;
        si.hStdError = err_write;
        si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    }

    std::string env_block;
    if (!options.env.empty()) env_block = build_environment_block(options.env);
    std::string cwd = options.cwd.empty() ? std::string() : options.cwd.string();

    DWORD flags = CREATE_SUSPENDED;
    if (options.new_process_group) flags |= CREATE_NEW_PROCESS_GROUP;

    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                       flags, env_block.empty() ? nullptr : env_block.data(),
                       cwd.empty() ? nullptr : cwd.c_str(), &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
        if (options.new_process_group) {
            handle.job_ = CreateJobObjectA(nullptr, nullptr);
            if (handle.job_) AssignProcessToJobObject(handle.job_, pi.hProcess);
        }
        ResumeThread(pi.hThread);
    } else {
        handle.spawn_error_ = "CreateProcess failed with error " + std::to_string(GetLastError());
        handle.close_pipes();
    }

    if (out_write != INVALID_HANDLE_VALUE) CloseHandle(out_write);
    if (err_write != INVALID_HANDLE_VALUE) CloseHandle(err_write);
    return handle;
}

ProcessResult run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           const SpawnOptions& options,
                           int timeout_ms) {
    ProcessResult result;
    SpawnOptions opts = options;
    opts.capture_output = true;

    ProcessHandle handle = spawn(program, args, opts);
    if (!handle.valid()) {
        result.spawn_failed = true;
        result.stderr_data = handle.spawn_error();
        return result;
    }

    // One reader per pipe; blocking ReadFile returns when the writers close.
    auto drain = [](HANDLE h, std::string& out) {
        char buf[4096];
        DWORD n = 0;
        while (ReadFile(h, buf, sizeof(buf), &n, nullptr) && n > 0) {
            out.append(buf, n);
        }
    };
    std::thread out_reader(drain, handle.stdout_read_, std::ref(result.stdout_data));
    std::thread err_reader(drain, handle.stderr_read_, std::ref(result.stderr_data));

    DWORD wait_ms = timeout_ms < 0 ? INFINITE : static_cast<DWORD>(timeout_ms);
    if (WaitForSingleObject(handle.handle_, wait_ms) == WAIT_TIMEOUT) {
        result.timed_out = true;
        handle.terminate();
    }
    handle.try_reap(true);
    if (handle.job_) TerminateJobObject(handle.job_, 1);

    out_reader.join();
    err_reader.join();

    result.exit_code = result.timed_out ? -1 : handle.exit_code_;
    return result;
}

ProcessResult run_shell(const std::string& command,
                        const SpawnOptions& options,
                        int timeout_ms) {
    return run_captured("cmd", {"/C", command}, options, timeout_ms);
}

#else // Unix

static void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Child side: report errno through the status pipe and exit.
[[noreturn]] static void child_fail(int status_fd, int err) {
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (options.capture_output) {
        if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
            handle.spawn_error_ = std::string("pipe failed: ") + std::strerror(errno);
            close_pair(out_pipe);
            close_pair(err_pipe);
            return handle;
        }
        set_cloexec(out_pipe[0]);
        set_cloexec(err_pipe[0]);
    }
    if (pipe(status_pipe) != 0) {
        handle.spawn_error_ = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return handle;
    }
    set_cloexec(status_pipe[0]);
    set_cloexec(status_pipe[1]);

    // Build argv before forking; only async-signal-safe calls in the child.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::string cwd = options.cwd.string();

    pid_t pid = fork();
    if (pid < 0) {
        handle.spawn_error_ = std::string("fork failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return handle;
    }

    if (pid == 0) {
        // Child process
        if (options.new_process_group) setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (options.capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_fail(status_pipe[1], errno);
        }

        for (const auto& [key, value] : options.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        child_fail(status_pipe[1], errno);
    }

    // Parent
    if (options.new_process_group) setpgid(pid, pid);  // no-op race guard
    handle.pid_ = pid;
    handle.group_ = options.new_process_group;

    close(status_pipe[1]);
    if (options.capture_output) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        handle.stdout_fd_ = out_pipe[0];
        handle.stderr_fd_ = err_pipe[0];
    }

    // The status pipe closes on successful exec (CLOEXEC) or carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        handle.spawn_error_ = "failed to start '" + program + "': " + std::strerror(child_errno);
        handle.try_reap(true);
        handle.close_pipes();
        handle.pid_ = -1;
    }

    return handle;
}

ProcessResult run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           const SpawnOptions& options,
                           int timeout_ms) {
    using clock = std::chrono::steady_clock;

    ProcessResult result;
    SpawnOptions opts = options;
    opts.capture_output = true;

    ProcessHandle handle = spawn(program, args, opts);
    if (!handle.valid()) {
        result.spawn_failed = true;
        result.stderr_data = handle.spawn_error();
        return result;
    }

    const auto start = clock::now();
    const bool bounded = timeout_ms >= 0;
    const auto deadline = start + std::chrono::milliseconds(bounded ? timeout_ms : 0);
    // After the child exits, grandchildren may keep the pipes open; stop
    // reading once they have been quiet this long.
    const auto drain_window = std::chrono::milliseconds(500);
    clock::time_point exited_at{};

    char buf[4096];
    while (handle.stdout_fd_ >= 0 || handle.stderr_fd_ >= 0) {
        if (!handle.reaped_ && handle.try_reap(false)) {
            exited_at = clock::now();
        }
        if (handle.reaped_ && clock::now() - exited_at > drain_window) break;

        if (!handle.reaped_ && bounded && clock::now() >= deadline) {
            result.timed_out = true;
            handle.terminate();
            break;
        }

        struct pollfd fds[2];
        int nfds = 0;
        int* owners[2];
        if (handle.stdout_fd_ >= 0) {
            fds[nfds] = {handle.stdout_fd_, POLLIN, 0};
            owners[nfds++] = &handle.stdout_fd_;
        }
        if (handle.stderr_fd_ >= 0) {
            fds[nfds] = {handle.stderr_fd_, POLLIN, 0};
            owners[nfds++] = &handle.stderr_fd_;
        }

        int rc = poll(fds, nfds, PROCESS_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        for (int i = 0; i < nfds; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t got = read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                std::string& sink = (owners[i] == &handle.stdout_fd_)
                    ? result.stdout_data : result.stderr_data;
                sink.append(buf, static_cast<size_t>(got));
            } else if (got == 0 || (got < 0 && errno != EINTR && errno != EAGAIN)) {
                close(*owners[i]);
                *owners[i] = -1;
            }
        }
    }
    handle.close_pipes();

    if (!result.timed_out) {
        if (!handle.reaped_ && bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - clock::now()).count();
            if (handle.wait(left > 0 ? static_cast<int>(left) : 0) < 0 && !handle.reaped_) {
                result.timed_out = true;
                handle.terminate();
            }
        } else if (!handle.reaped_) {
            handle.try_reap(true);
        }
    }

    result.exit_code = result.timed_out ? -1 : handle.exit_code_;
    return result;
}

ProcessResult run_shell(const std::string& command,
                        const SpawnOptions& options,
                        int timeout_ms) {
    return run_captured("/bin/sh", {"-c", command}, options, timeout_ms);
}

#endif

} // namespace platform
