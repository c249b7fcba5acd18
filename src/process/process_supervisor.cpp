#include "process/process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

extern char** environ;

namespace sqlbridge::process {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr std::size_t kMaxStartupDiagnostic = 2048;

// What the child reports through the exec-status pipe before _exit.
struct ChildFailure {
    int stage;  // 0: chdir, 1: execve
    int error;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> resolve_executable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return name;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::istringstream dirs(path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        const auto candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::vector<std::string> merged_environment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string value(*entry);
        const std::string key = value.substr(0, value.find('='));
        if (overrides.find(key) != overrides.end()) {
            continue;
        }
        merged.push_back(value);
    }
    for (const auto& [key, value] : overrides) {
        merged.push_back(key + "=" + value);
    }
    return merged;
}

std::vector<char*> as_c_array(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& value : values) {
        out.push_back(value.data());
    }
    out.push_back(nullptr);
    return out;
}

// Whatever the child managed to print before dying, for the error hint.
std::string read_available(const int fd) {
    std::string text;
    char buffer[512];
    while (text.size() < kMaxStartupDiagnostic) {
        pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, 0) <= 0 || (pfd.revents & (POLLIN | POLLHUP)) == 0) {
            break;
        }
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n <= 0) {
            break;
        }
        text.append(buffer, static_cast<std::size_t>(n));
    }
    return text;
}

}  // namespace

ProcessHandle::ProcessHandle(const pid_t pid, const int stdin_fd, const int stdout_fd,
                             const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ProcessHandle::~ProcessHandle() {
    terminate(ProcessSupervisor::kDefaultShutdownGrace);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

core::errors::Result<std::size_t> ProcessHandle::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        return core::errors::session_closed_error("Server input is closed.");
    }

    const std::string frame = line + "\n";
    std::size_t written = 0;
    while (written < frame.size()) {
        const ssize_t n = write(stdin_fd_, frame.data() + written, frame.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const int err = errno;
        if (err == EPIPE) {
            return core::errors::session_closed_error(
                "Server process is not accepting input.");
        }
        return BridgeError{ErrorCategory::Internal,
                           std::string("Failed to write to server: ") + std::strerror(err),
                           "pipe_write_failed"};
    }
    return written;
}

bool ProcessHandle::reap_locked(const bool block) {
    if (exited_) {
        return true;
    }
    int status = 0;
    while (true) {
        const pid_t waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
        if (waited == pid_) {
            exited_ = true;
            exit_code_ = decode_status(status);
            return true;
        }
        if (waited < 0 && errno == EINTR) {
            continue;
        }
        if (waited < 0 && errno == ECHILD) {
            exited_ = true;
            return true;
        }
        return false;
    }
}

bool ProcessHandle::is_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !reap_locked(false);
}

std::optional<int> ProcessHandle::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exited_) {
        return std::nullopt;
    }
    return exit_code_;
}

void ProcessHandle::mark_stream_closed(const StreamKind stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream == StreamKind::Stdout) {
        stdout_closed_ = true;
    } else {
        stderr_closed_ = true;
    }
    LOG_DEBUG("ProcessHandle: " + to_string(stream) + " closed for pid " +
              std::to_string(pid_));
    if (stdout_closed_ && stderr_closed_) {
        static_cast<void>(reap_locked(false));
    }
}

bool ProcessHandle::stream_closed(const StreamKind stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream == StreamKind::Stdout ? stdout_closed_ : stderr_closed_;
}

void ProcessHandle::close_stdin() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
}

void ProcessHandle::terminate(const std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
        return;
    }
    terminated_ = true;

    // EOF on stdin is the polite stop request; a writer blocked on a full pipe
    // keeps the fd until the signals below unblock it.
    bool stdin_closed = false;
    {
        std::unique_lock<std::mutex> write_lock(write_mutex_, std::try_to_lock);
        if (write_lock.owns_lock()) {
            close_fd(stdin_fd_);
            stdin_closed = true;
        }
    }

    if (reap_locked(false)) {
        LOG_DEBUG("ProcessHandle: pid " + std::to_string(pid_) + " already exited with " +
                  std::to_string(exit_code_));
    } else {
        LOG_INFO("ProcessHandle: stopping server pid " + std::to_string(pid_));
        static_cast<void>(kill(pid_, SIGTERM));

        const auto deadline = std::chrono::steady_clock::now() + grace;
        bool exited = false;
        while (!(exited = reap_locked(false)) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kPollInterval);
        }
        if (!exited) {
            LOG_WARN("ProcessHandle: pid " + std::to_string(pid_) +
                     " ignored SIGTERM, sending SIGKILL");
            static_cast<void>(kill(pid_, SIGKILL));
            static_cast<void>(reap_locked(true));
        }
        LOG_INFO("ProcessHandle: server pid " + std::to_string(pid_) + " exited with " +
                 std::to_string(exit_code_));
    }

    if (!stdin_closed) {
        close_stdin();
    }
}

core::errors::Result<std::unique_ptr<ProcessHandle>> ProcessSupervisor::start(
    const LaunchSpec& launch) const {
    ignore_sigpipe();

    const auto resolved = resolve_executable(launch.executable);
    if (!resolved) {
        return core::errors::spawn_error("Executable not found or not executable: " +
                                         launch.executable);
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(launch.executable);
    argv_storage.insert(argv_storage.end(), launch.args.begin(), launch.args.end());
    auto argv = as_c_array(argv_storage);
    std::vector<std::string> env_storage = merged_environment(launch.env);
    auto envp = as_c_array(env_storage);
    const std::string exe_path = *resolved;
    const std::string cwd = launch.working_directory.string();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe(status_pipe) != 0) {
        close_all();
        return BridgeError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }
    for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
        set_cloexec(fds[0]);
        set_cloexec(fds[1]);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close_all();
        return core::errors::spawn_error("Failed to fork server process.");
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        // Blocked and ignored dispositions survive execve; the server starts clean.
        sigset_t no_signals;
        sigemptyset(&no_signals);
        static_cast<void>(sigprocmask(SIG_SETMASK, &no_signals, nullptr));
        static_cast<void>(std::signal(SIGPIPE, SIG_DFL));
        ChildFailure failure{0, 0};
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            failure = ChildFailure{0, errno};
            static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
            _exit(126);
        }
        execve(exe_path.c_str(), argv.data(), envp.data());
        failure = ChildFailure{1, errno};
        static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe is close-on-exec: EOF means execve succeeded.
    ChildFailure failure{0, 0};
    ssize_t n = 0;
    do {
        n = read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_all();
        if (failure.stage == 0) {
            return core::errors::spawn_error("Cannot enter working directory " + cwd + ": " +
                                             std::strerror(failure.error));
        }
        return core::errors::spawn_error("Failed to launch " + launch.executable + ": " +
                                         std::strerror(failure.error));
    }

    LOG_INFO("ProcessSupervisor: started " + launch.executable + " (pid " +
             std::to_string(pid) + ")");

    const auto deadline = std::chrono::steady_clock::now() + launch.startup_grace;
    while (true) {
        int status = 0;
        pid_t waited = 0;
        do {
            waited = waitpid(pid, &status, WNOHANG);
        } while (waited < 0 && errno == EINTR);

        if (waited == pid) {
            const int exit_code = decode_status(status);
            auto error = core::errors::early_exit_error(exit_code);
            const std::string diagnostic = read_available(stderr_pipe[0]);
            if (!diagnostic.empty()) {
                error.hint = diagnostic;
            }
            LOG_ERROR("ProcessSupervisor: " + error.message);
            close_all();
            return error;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now));
    }

    return std::unique_ptr<ProcessHandle>(
        new ProcessHandle(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
}

void ProcessSupervisor::terminate(ProcessHandle& handle,
                                  const std::chrono::milliseconds grace) const {
    handle.terminate(grace);
}

}  // namespace sqlbridge::process
