#include "process/stream_pump.hpp"

#include <cctype>
#include <cerrno>
#include <poll.h>
#include <unistd.h>
#include <utility>

namespace sqlbridge::process {

namespace {

constexpr int kPollTimeoutMs = 50;

bool is_blank(const std::string& line) {
    for (const char c : line) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::vector<std::string> LineSplitter::feed(const char* data, const std::size_t size) {
    std::vector<std::string> lines;
    pending_.append(data, size);

    std::size_t start = 0;
    while (true) {
        const auto newline = pending_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = pending_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = newline + 1;
    }
    pending_.erase(0, start);
    return lines;
}

std::optional<std::string> LineSplitter::finish() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(pending_);
    pending_.clear();
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

bool is_configuration_error(const std::string& line) {
    return line.find("config.server") != std::string::npos ||
           line.find("configuration") != std::string::npos;
}

StreamPump::StreamPump(const int fd, const StreamKind stream,
                       std::shared_ptr<LineChannel> channel, ClosedCallback on_closed)
    : fd_(fd), stream_(stream), channel_(std::move(channel)), on_closed_(std::move(on_closed)) {}

StreamPump::~StreamPump() {
    stop();
}

void StreamPump::start() {
    if (thread_.joinable()) {
        return;
    }
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void StreamPump::stop() {
    stop_requested_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StreamPump::forward(std::string line) {
    if (is_blank(line)) {
        return;
    }
    ++lines_forwarded_;
    channel_->push(StreamEvent{stream_, false, std::move(line)});
}

void StreamPump::run() {
    LineSplitter splitter;
    char buffer[4096];
    bool end_of_stream = false;

    while (!stop_requested_.load()) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            end_of_stream = true;
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(fd_, buffer, sizeof(buffer));
        if (n > 0) {
            for (auto& line : splitter.feed(buffer, static_cast<std::size_t>(n))) {
                forward(std::move(line));
            }
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        end_of_stream = true;
        break;
    }

    if (auto tail = splitter.finish()) {
        forward(std::move(*tail));
    }
    channel_->push(StreamEvent{stream_, true, ""});
    if (end_of_stream && on_closed_) {
        on_closed_(stream_);
    }
    running_ = false;
}

}  // namespace sqlbridge::process
