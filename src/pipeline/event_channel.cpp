#include "voice_replacer/pipeline/event_channel.h"

#include "voice_replacer/logging/logger.h"

#include <utility>

namespace voice_replacer {
namespace pipeline {

EventChannel::~EventChannel() {
    stop();
    if (thread_.joinable()) {
        // Only reachable when the last stop() ran on the dispatcher thread itself
        thread_.detach();
    }
}

void EventChannel::start(Handler handler) {
    // A previous dispatcher that stopped itself from a handler is reaped here
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    handler_ = std::move(handler);
    events_.clear();
    running_ = true;
    thread_ = std::thread(&EventChannel::run, this);
}

void EventChannel::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        events_.clear();
    }
    cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() == std::this_thread::get_id()) {
        // Called from a handler: the loop exits after it returns
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

void EventChannel::post(PipelineEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        if (std::holds_alternative<StatusEvent>(event) && !events_.empty() &&
            std::holds_alternative<StatusEvent>(events_.back())) {
            events_.back() = std::move(event);
        } else {
            events_.push_back(std::move(event));
        }
    }
    cv_.notify_one();
}

bool EventChannel::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

size_t EventChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void EventChannel::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return !running_ || !events_.empty(); });
        if (!running_) {
            break;
        }
        PipelineEvent event = std::move(events_.front());
        events_.pop_front();
        Handler handler = handler_;
        lock.unlock();

        if (handler) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                LOG_ERROR("[EventChannel] Event handler threw: {}", e.what());
            }
        }
        lock.lock();
    }
}

}  // namespace pipeline
}  // namespace voice_replacer
