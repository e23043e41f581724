/**
 * @file test_event_channel.cpp
 * @brief Unit tests for the worker -> presentation event channel
 */

#include "fakes/fake_components.h"
#include "voice_replacer/pipeline/event_channel.h"

#include <atomic>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace voice_replacer::pipeline;
using test_fakes::waitFor;

namespace {

struct Recorder {
    std::mutex mutex;
    std::vector<std::string> seen;

    void operator()(const PipelineEvent& event) {
        std::string entry;
        if (auto* text = std::get_if<TextEvent>(&event)) {
            entry = "text:" + text->text;
        } else if (auto* error = std::get_if<ErrorEvent>(&event)) {
            entry = "error:" + error->message;
        } else {
            entry = std::string("status:") +
                    pipelineStateToString(std::get<StatusEvent>(event).status.state);
        }
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(entry);
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return seen;
    }
};

StatusEvent statusOf(PipelineState state) {
    return StatusEvent{makeStatus(state, 0.0, 0, "")};
}

}  // namespace

TEST(EventChannel, DeliversInPostingOrder) {
    Recorder recorder;
    EventChannel channel;
    channel.start([&recorder](const PipelineEvent& e) { recorder(e); });

    channel.post(TextEvent{"one"});
    channel.post(ErrorEvent{"two"});
    channel.post(TextEvent{"three"});

    ASSERT_TRUE(waitFor([&recorder] { return recorder.snapshot().size() == 3; }));
    auto seen = recorder.snapshot();
    EXPECT_EQ(seen[0], "text:one");
    EXPECT_EQ(seen[1], "error:two");
    EXPECT_EQ(seen[2], "text:three");
    channel.stop();
}

TEST(EventChannel, PostBeforeStartIsDropped) {
    Recorder recorder;
    EventChannel channel;
    channel.post(TextEvent{"lost"});
    channel.start([&recorder](const PipelineEvent& e) { recorder(e); });
    channel.post(TextEvent{"kept"});

    ASSERT_TRUE(waitFor([&recorder] { return recorder.snapshot().size() == 1; }));
    EXPECT_EQ(recorder.snapshot()[0], "text:kept");
    channel.stop();
}

TEST(EventChannel, ConsecutiveStatusEventsCollapse) {
    std::mutex gate;
    std::unique_lock<std::mutex> hold(gate);
    Recorder recorder;
    EventChannel channel;
    channel.start([&](const PipelineEvent& e) {
        std::lock_guard<std::mutex> wait(gate);
        recorder(e);
    });

    channel.post(TextEvent{"blocker"});
    ASSERT_TRUE(waitFor([&channel] { return channel.pending() == 0; }));
    channel.post(statusOf(PipelineState::Listening));
    channel.post(statusOf(PipelineState::Recognizing));
    channel.post(statusOf(PipelineState::Synthesizing));
    EXPECT_EQ(channel.pending(), 1u);
    hold.unlock();

    ASSERT_TRUE(waitFor([&recorder] { return recorder.snapshot().size() == 2; }));
    EXPECT_EQ(recorder.snapshot()[1], "status:synthesizing");
    channel.stop();
}

TEST(EventChannel, NoHandlerRunsAfterStop) {
    std::atomic<int> calls{0};
    EventChannel channel;
    channel.start([&calls](const PipelineEvent&) { calls.fetch_add(1); });
    channel.stop();
    EXPECT_FALSE(channel.running());

    channel.post(TextEvent{"late"});
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(calls.load(), 0);
}

TEST(EventChannel, ThrowingHandlerDoesNotKillDispatcher) {
    std::atomic<int> calls{0};
    EventChannel channel;
    channel.start([&calls](const PipelineEvent&) {
        if (calls.fetch_add(1) == 0) {
            throw std::runtime_error("presenter failed");
        }
    });
    channel.post(TextEvent{"a"});
    channel.post(TextEvent{"b"});
    EXPECT_TRUE(waitFor([&calls] { return calls.load() == 2; }));
    channel.stop();
}

TEST(EventChannel, StopFromHandlerIsAllowed) {
    std::atomic<int> calls{0};
    EventChannel channel;
    channel.start([&](const PipelineEvent&) {
        calls.fetch_add(1);
        channel.stop();
    });
    channel.post(TextEvent{"a"});
    ASSERT_TRUE(waitFor([&channel] { return !channel.running(); }));
    channel.post(TextEvent{"b"});
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(calls.load(), 1);

    // Restart reaps the old dispatcher
    channel.start([&calls](const PipelineEvent&) { calls.fetch_add(1); });
    channel.post(TextEvent{"c"});
    EXPECT_TRUE(waitFor([&calls] { return calls.load() == 2; }));
    channel.stop();
}
