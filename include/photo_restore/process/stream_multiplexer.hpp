#pragma once

#include "photo_restore/process/line_channel.hpp"
#include "photo_restore/process/process_runner.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace photo_restore::process {

// Splits a byte stream into lines on '\n', stripping a trailing '\r'.
class LineSplitter {
public:
    std::vector<std::string> feed(const char* data, size_t size);
    // Unterminated remainder at end of stream, if any.
    std::optional<std::string> finish();

private:
    std::string buffer_;
};

/**
 * Reads a child's stdout and stderr on one thread each and merges their
 * lines into a single channel. Per-stream order is preserved; there is no
 * ordering between the two streams.
 */
class StreamMultiplexer {
public:
    StreamMultiplexer(UniqueFd stdout_fd, UniqueFd stderr_fd);
    ~StreamMultiplexer();

    StreamMultiplexer(const StreamMultiplexer&) = delete;
    StreamMultiplexer& operator=(const StreamMultiplexer&) = delete;

    [[nodiscard]] RecvStatus recv_for(std::chrono::milliseconds timeout, OutputLine& out) {
        return channel_.recv_for(timeout, out);
    }
    [[nodiscard]] std::optional<OutputLine> try_recv() { return channel_.try_recv(); }

    // Waits until both streams reached end of stream.
    void join();

private:
    LineChannel channel_;
    std::thread stdout_reader_;
    std::thread stderr_reader_;
};

} // namespace photo_restore::process
