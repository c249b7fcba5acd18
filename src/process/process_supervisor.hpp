#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "process/line_transport.hpp"

namespace sqlbridge::process {

struct LaunchSpec {
    std::string executable;  // absolute/relative path, or a name searched in PATH
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // layered over the parent environment
    std::filesystem::path working_directory;  // empty: inherit
    std::chrono::milliseconds startup_grace{2000};
};

// A running child with piped stdin/stdout/stderr. Owns all three fds.
// The stdout/stderr fds are read by pumps; they are closed only on destruction,
// so pumps must be stopped before the handle goes away.
class ProcessHandle : public LineWriter {
public:
    ~ProcessHandle() override;

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    core::errors::Result<std::size_t> write_line(const std::string& line) override;

    // Reaps the child without blocking.
    bool is_running();
    std::optional<int> exit_code() const;

    // Called by a pump when its stream reaches end-of-stream.
    void mark_stream_closed(StreamKind stream);
    bool stream_closed(StreamKind stream) const;

    // SIGTERM, wait up to `grace`, then SIGKILL. Idempotent, any thread.
    void terminate(std::chrono::milliseconds grace);

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

private:
    friend class ProcessSupervisor;
    ProcessHandle(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    bool reap_locked(bool block);
    void close_stdin();

    mutable std::mutex mutex_;
    std::mutex write_mutex_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    bool exited_ = false;
    bool terminated_ = false;
    int exit_code_ = -1;
    bool stdout_closed_ = false;
    bool stderr_closed_ = false;
};

class ProcessSupervisor {
public:
    static constexpr std::chrono::milliseconds kDefaultShutdownGrace{5000};

    // Spawn error if the executable cannot be launched, early-exit error if
    // the child dies inside launch.startup_grace.
    core::errors::Result<std::unique_ptr<ProcessHandle>> start(const LaunchSpec& launch) const;

    void terminate(ProcessHandle& handle,
                   std::chrono::milliseconds grace = kDefaultShutdownGrace) const;
};

}  // namespace sqlbridge::process
