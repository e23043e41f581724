#ifndef VOICE_REPLACER_FRAME_QUEUE_H
#define VOICE_REPLACER_FRAME_QUEUE_H

#include "voice_replacer/audio/frame.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace voice_replacer {
namespace audio {

// Bounded FIFO between the capture thread and the segmentation worker.
//
// Usage:
//   FrameQueue queue(64);
//   queue.push(std::move(frame));       // capture thread, never blocks
//   auto f = queue.pop(timeout);        // worker thread
//
// Overflow policy: push() into a full queue evicts the oldest frame and
// increments droppedCount(). The critical section is O(1) and nothing is
// freed while the lock is held.
//
// close() wakes every waiter; pop() then drains what is left and returns
// nullopt once empty.
class FrameQueue {
   public:
    explicit FrameQueue(size_t capacity);

    // Producer side. Returns false if a frame was evicted to make room.
    bool push(Frame frame);

    // Producer side for callers that must not lose audio. Throws
    // QueueOverflowError instead of evicting.
    void pushStrict(Frame frame);

    // Consumer side. Waits up to timeout for a frame.
    std::optional<Frame> pop(std::chrono::milliseconds timeout);

    void clear();
    void close();
    void reopen();

    size_t size() const;
    size_t capacity() const {
        return capacity_;
    }
    bool closed() const;

    uint64_t droppedCount() const {
        return dropped_.load(std::memory_order_relaxed);
    }
    uint64_t pushedCount() const {
        return pushed_.load(std::memory_order_relaxed);
    }

   private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> frames_;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> pushed_{0};
};

}  // namespace audio
}  // namespace voice_replacer

#endif  // VOICE_REPLACER_FRAME_QUEUE_H
