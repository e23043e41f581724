#include "voice_replacer/audio/frame_queue.h"

#include "voice_replacer/core/errors.h"

#include <string>
#include <utility>

namespace voice_replacer {
namespace audio {

FrameQueue::FrameQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool FrameQueue::push(Frame frame) {
    // Evicted frame is destroyed after the lock is released
    std::optional<Frame> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return true;
        }
        if (frames_.size() >= capacity_) {
            evicted.emplace(std::move(frames_.front()));
            frames_.pop_front();
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        frames_.push_back(std::move(frame));
        pushed_.fetch_add(1, std::memory_order_relaxed);
    }
    cv_.notify_one();
    return !evicted.has_value();
}

void FrameQueue::pushStrict(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frames_.size() >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            throw QueueOverflowError("frame queue full (capacity " + std::to_string(capacity_) +
                                     ")");
        }
        frames_.push_back(std::move(frame));
        pushed_.fetch_add(1, std::memory_order_relaxed);
    }
    cv_.notify_one();
}

std::optional<Frame> FrameQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
    if (frames_.empty()) {
        return std::nullopt;
    }
    Frame frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void FrameQueue::clear() {
    std::deque<Frame> discarded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        discarded.swap(frames_);
    }
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void FrameQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

bool FrameQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace audio
}  // namespace voice_replacer
