#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace photo_restore::process {

enum class StreamOrigin : uint8_t { Stdout, Stderr };

struct OutputLine {
    StreamOrigin origin = StreamOrigin::Stdout;
    std::string text;
};

enum class RecvStatus : uint8_t { Line, Timeout, Closed };

/**
 * Multi-producer, single-consumer hand-off queue for worker output lines.
 * Each producer calls close_sender() exactly once when it is done; the
 * channel reports Closed once every producer closed and the queue is empty.
 */
class LineChannel {
public:
    explicit LineChannel(int senders) noexcept;

    LineChannel(const LineChannel&) = delete;
    LineChannel& operator=(const LineChannel&) = delete;

    void send(OutputLine line);
    void close_sender() noexcept;

    // Blocks for at most timeout waiting for a line.
    [[nodiscard]] RecvStatus recv_for(std::chrono::milliseconds timeout, OutputLine& out);
    [[nodiscard]] std::optional<OutputLine> try_recv();

    [[nodiscard]] bool closed() const noexcept;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<OutputLine> queue_;
    int open_senders_;
};

} // namespace photo_restore::process
