#include "photo_restore/process/stream_multiplexer.hpp"
#include "photo_restore/core/utils.hpp"

#include <cerrno>
#include <cstring>
#include <functional>
#include <iostream>

#include <unistd.h>

namespace photo_restore::process {

std::vector<std::string> LineSplitter::feed(const char* data, size_t size) {
    buffer_.append(data, size);

    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        const size_t idx = buffer_.find('\n', start);
        if (idx == std::string::npos) break;

        std::string line = buffer_.substr(start, idx - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = idx + 1;
    }
    buffer_.erase(0, start);
    return lines;
}

std::optional<std::string> LineSplitter::finish() {
    if (buffer_.empty()) {
        return std::nullopt;
    }
    std::string rest;
    rest.swap(buffer_);
    if (rest.back() == '\r') {
        rest.pop_back();
    }
    return rest;
}

namespace {

const char* origin_name(StreamOrigin origin) {
    return origin == StreamOrigin::Stdout ? "stdout" : "stderr";
}

void read_lines(UniqueFd fd, StreamOrigin origin, LineChannel& channel) {
    LineSplitter splitter;
    bool warned = false;

    auto deliver = [&](std::string line) {
        if (core::drop_invalid_utf8(line) > 0 && !warned) {
            std::cerr << "[STREAM] dropped undecodable bytes on worker "
                      << origin_name(origin) << std::endl;
            warned = true;
        }
        channel.send(OutputLine{origin, std::move(line)});
    };

    char buf[4096];
    while (true) {
        const ssize_t r = ::read(fd.get(), buf, sizeof(buf));
        if (r > 0) {
            for (auto& line : splitter.feed(buf, static_cast<size_t>(r))) {
                deliver(std::move(line));
            }
        } else if (r == 0) {
            break;
        } else if (errno == EINTR) {
            continue;
        } else {
            std::cerr << "[STREAM] read error on worker " << origin_name(origin)
                      << ": " << std::strerror(errno) << std::endl;
            break;
        }
    }

    if (auto rest = splitter.finish()) {
        deliver(std::move(*rest));
    }
    channel.close_sender();
}

} // namespace

StreamMultiplexer::StreamMultiplexer(UniqueFd stdout_fd, UniqueFd stderr_fd)
    : channel_(2) {
    stdout_reader_ = std::thread(read_lines, std::move(stdout_fd), StreamOrigin::Stdout,
                                 std::ref(channel_));
    try {
        stderr_reader_ = std::thread(read_lines, std::move(stderr_fd), StreamOrigin::Stderr,
                                     std::ref(channel_));
    } catch (const std::system_error&) {
        stdout_reader_.join();
        throw;
    }
}

StreamMultiplexer::~StreamMultiplexer() {
    join();
}

void StreamMultiplexer::join() {
    if (stdout_reader_.joinable()) stdout_reader_.join();
    if (stderr_reader_.joinable()) stderr_reader_.join();
}

} // namespace photo_restore::process
