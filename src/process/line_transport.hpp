#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace sqlbridge::process {

enum class StreamKind {
    Stdout,
    Stderr
};

// The only data that crosses from a pump thread to the correlator thread.
struct StreamEvent {
    StreamKind stream = StreamKind::Stdout;
    bool closed = false;  // end-of-stream marker, `line` is empty
    std::string line;
};

// Writes one line plus terminator to the server's input. Implementations
// serialize concurrent callers so lines never interleave.
class LineWriter {
public:
    virtual ~LineWriter() = default;
    virtual core::errors::Result<std::size_t> write_line(const std::string& line) = 0;
};

// Multi-producer, single-consumer queue of stream events.
class LineChannel {
public:
    void push(StreamEvent event);

    // Blocks until an event is available or `deadline` passes.
    std::optional<StreamEvent> pop_until(std::chrono::steady_clock::time_point deadline);
    std::optional<StreamEvent> try_pop();

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<StreamEvent> events_;
};

inline std::string to_string(const StreamKind kind) {
    return kind == StreamKind::Stdout ? "stdout" : "stderr";
}

}  // namespace sqlbridge::process
