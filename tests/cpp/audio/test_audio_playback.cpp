/**
 * @file test_audio_playback.cpp
 * @brief Unit tests for AudioPlayback (rendering, cancel, device switching)
 */

#include "fakes/fake_components.h"
#include "voice_replacer/audio/audio_playback.h"

#include <gtest/gtest.h>
#include <thread>

using namespace voice_replacer;
using namespace voice_replacer::audio;
using namespace test_fakes;

namespace {

std::vector<AudioChunk> makeChunks(size_t samples, uint32_t rate = 22050) {
    std::vector<AudioChunk> chunks(1);
    chunks[0].samples = toneBlock(samples, 1000);
    chunks[0].sampleRate = rate;
    return chunks;
}

}  // namespace

class AudioPlaybackTest : public ::testing::Test {
   protected:
    std::shared_ptr<PlaybackState> state = std::make_shared<PlaybackState>();
    std::unique_ptr<AudioPlayback> playback;

    void create(DeviceSwitchPolicy policy = DeviceSwitchPolicy::Drain) {
        AudioPlayback::Config config;
        config.periodFrames = 256;
        config.switchPolicy = policy;
        playback = std::make_unique<AudioPlayback>(std::make_unique<FakePlaybackSink>(state),
                                                   config);
    }

    void SetUp() override {
        create();
    }
};

TEST_F(AudioPlaybackTest, PlaysEverySampleInPeriodPieces) {
    int firstSampleCalls = 0;
    EXPECT_TRUE(playback->play(makeChunks(1000), [&firstSampleCalls] { ++firstSampleCalls; }));

    EXPECT_EQ(state->samplesWritten(), 1000u);
    EXPECT_EQ(state->writes.load(), 4);  // 256 * 3 + 232
    EXPECT_EQ(firstSampleCalls, 1);
    EXPECT_EQ(state->rate, 22050u);
    EXPECT_EQ(playback->resultsPlayed(), 1u);
    EXPECT_FALSE(playback->isPlaying());
}

TEST_F(AudioPlaybackTest, EmptyChunksWriteNothing) {
    std::vector<AudioChunk> chunks(2);
    EXPECT_TRUE(playback->play(std::move(chunks)));
    EXPECT_EQ(state->samplesWritten(), 0u);
}

TEST_F(AudioPlaybackTest, CancelHaltsWithinOnePeriod) {
    state->writeDelay = std::chrono::milliseconds(5);
    bool completed = true;
    std::thread player([&] { completed = playback->play(makeChunks(256 * 200)); });

    ASSERT_TRUE(waitFor([this] { return state->writes.load() >= 2; }));
    playback->cancel();
    player.join();

    EXPECT_FALSE(completed);
    EXPECT_LT(state->samplesWritten(), 256u * 200u);
    EXPECT_GE(state->drops, 1);
    EXPECT_EQ(playback->resultsPlayed(), 0u);
}

TEST_F(AudioPlaybackTest, CancelWhileIdleDoesNotAffectNextPlay) {
    playback->cancel();
    EXPECT_TRUE(playback->play(makeChunks(300)));
    EXPECT_EQ(state->samplesWritten(), 300u);
}

TEST_F(AudioPlaybackTest, WriteFailureThrowsDeviceError) {
    state->failWrites = true;
    try {
        playback->play(makeChunks(300));
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DEVICE_IO_FAILED);
    }
    EXPECT_FALSE(playback->isPlaying());
}

TEST_F(AudioPlaybackTest, IdleSwitchAppliesImmediately) {
    playback->switchDevice("hw:Loopback,0,0");
    EXPECT_EQ(playback->currentDevice(), "hw:Loopback,0,0");
    EXPECT_EQ(state->currentDevice(), "hw:Loopback,0,0");

    playback->play(makeChunks(100));
    EXPECT_EQ(state->currentDevice(), "hw:Loopback,0,0");
}

TEST_F(AudioPlaybackTest, IdleSwitchFailureKeepsPreviousDevice) {
    playback->switchDevice("hw:PCH,0");
    state->failingDevices.insert("hw:Gone,0");

    EXPECT_THROW(playback->switchDevice("hw:Gone,0"), DeviceError);
    EXPECT_EQ(playback->currentDevice(), "hw:PCH,0");
    EXPECT_EQ(state->currentDevice(), "hw:PCH,0");
}

TEST_F(AudioPlaybackTest, SwitchDuringPlaybackDrainsCurrentChunk) {
    state->writeDelay = std::chrono::milliseconds(2);
    std::thread player([&] { playback->play(makeChunks(256 * 20)); });
    ASSERT_TRUE(waitFor([this] { return state->writes.load() >= 1; }));

    playback->switchDevice("hw:Loopback,0,0");
    player.join();

    // Whole chunk rendered on the first device, switch applied afterwards
    EXPECT_EQ(state->samplesWritten(), 256u * 20u);
    EXPECT_EQ(playback->currentDevice(), "hw:Loopback,0,0");
    EXPECT_EQ(state->openedDevices().back(), "hw:Loopback,0,0");
}

TEST_F(AudioPlaybackTest, DiscardPolicyDropsRestOfChunk) {
    create(DeviceSwitchPolicy::Discard);
    state->writeDelay = std::chrono::milliseconds(2);
    std::thread player([&] { playback->play(makeChunks(256 * 200)); });
    ASSERT_TRUE(waitFor([this] { return state->writes.load() >= 1; }));

    playback->switchDevice("hw:Loopback,0,0");
    player.join();

    EXPECT_LT(state->samplesWritten(), 256u * 200u);
    EXPECT_EQ(playback->currentDevice(), "hw:Loopback,0,0");
}

TEST_F(AudioPlaybackTest, FailedSwitchDuringPlaybackReportsAndKeepsDevice) {
    std::atomic<int> reports{0};
    playback->setErrorHandler([&reports](const std::string&) { reports.fetch_add(1); });
    state->failingDevices.insert("hw:Gone,0");
    state->writeDelay = std::chrono::milliseconds(2);

    bool completed = false;
    std::thread player([&] { completed = playback->play(makeChunks(256 * 20)); });
    ASSERT_TRUE(waitFor([this] { return state->writes.load() >= 1; }));
    playback->switchDevice("hw:Gone,0");
    player.join();

    EXPECT_TRUE(completed);
    EXPECT_EQ(reports.load(), 1);
    EXPECT_EQ(playback->currentDevice(), "default");
}

TEST_F(AudioPlaybackTest, CloseReleasesDevice) {
    playback->play(makeChunks(100));
    playback->close();
    EXPECT_FALSE(state->open);
}
