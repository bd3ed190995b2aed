#include "photo_restore/process/line_channel.hpp"

namespace photo_restore::process {

LineChannel::LineChannel(int senders) noexcept : open_senders_(senders) {}

void LineChannel::send(OutputLine line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(line));
    }
    available_.notify_one();
}

void LineChannel::close_sender() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_senders_ > 0) {
            --open_senders_;
        }
    }
    available_.notify_all();
}

RecvStatus LineChannel::recv_for(std::chrono::milliseconds timeout, OutputLine& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = available_.wait_for(lock, timeout, [this] {
        return !queue_.empty() || open_senders_ == 0;
    });

    if (!queue_.empty()) {
        out = std::move(queue_.front());
        queue_.pop_front();
        return RecvStatus::Line;
    }
    return ready ? RecvStatus::Closed : RecvStatus::Timeout;
}

std::optional<OutputLine> LineChannel::try_recv() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    OutputLine line = std::move(queue_.front());
    queue_.pop_front();
    return line;
}

bool LineChannel::closed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_senders_ == 0 && queue_.empty();
}

} // namespace photo_restore::process
