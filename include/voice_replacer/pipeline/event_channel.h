#pragma once

#include "voice_replacer/pipeline/pipeline_state.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

namespace voice_replacer {
namespace pipeline {

struct StatusEvent {
    PipelineStatus status;
};

struct TextEvent {
    std::string text;
};

struct ErrorEvent {
    std::string message;
};

using PipelineEvent = std::variant<StatusEvent, TextEvent, ErrorEvent>;

/**
 * @brief Single-consumer event channel between the workers and presentation.
 *
 * Workers post() without waiting on the consumer. One dispatcher thread
 * delivers events in posting order, so each callback has at most one call in
 * flight. Consecutive status events collapse into the newest one.
 *
 * stop() discards undelivered events; once it returns no handler runs again.
 * Calling stop() from inside a handler is allowed.
 */
class EventChannel {
   public:
    using Handler = std::function<void(const PipelineEvent&)>;

    EventChannel() = default;
    ~EventChannel();

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void start(Handler handler);
    void stop();
    void post(PipelineEvent event);

    bool running() const;
    size_t pending() const;

   private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<PipelineEvent> events_;
    Handler handler_;
    bool running_ = false;
    std::thread thread_;
};

}  // namespace pipeline
}  // namespace voice_replacer
