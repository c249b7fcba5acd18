#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "process/line_transport.hpp"

namespace sqlbridge::process {

// Splits a byte stream into lines. A trailing '\r' is dropped.
class LineSplitter {
public:
    std::vector<std::string> feed(const char* data, std::size_t size);
    std::optional<std::string> finish();

private:
    std::string pending_;
};

// True when a stderr line carries the server's configuration-error signature.
bool is_configuration_error(const std::string& line);

// Reads one fd on a dedicated thread and forwards every non-blank line, in
// read order, into the channel. At end-of-stream a `closed` event is pushed
// and `on_closed` runs on the pump thread.
class StreamPump {
public:
    using ClosedCallback = std::function<void(StreamKind)>;

    StreamPump(int fd, StreamKind stream, std::shared_ptr<LineChannel> channel,
               ClosedCallback on_closed = {});
    ~StreamPump();

    StreamPump(const StreamPump&) = delete;
    StreamPump& operator=(const StreamPump&) = delete;

    void start();
    // Asks the thread to stop at its next poll tick and joins it.
    void stop();

    bool running() const { return running_.load(); }
    std::size_t lines_forwarded() const { return lines_forwarded_.load(); }

private:
    void run();
    void forward(std::string line);

    int fd_;
    StreamKind stream_;
    std::shared_ptr<LineChannel> channel_;
    ClosedCallback on_closed_;
    std::thread thread_;
    std::atomic_bool stop_requested_{false};
    std::atomic_bool running_{false};
    std::atomic<std::size_t> lines_forwarded_{0};
};

}  // namespace sqlbridge::process
