/**
 * @file test_pipeline_state.cpp
 * @brief Unit tests for the pipeline state machine and status snapshots
 */

#include "voice_replacer/pipeline/pipeline_state.h"

#include <gtest/gtest.h>

using namespace voice_replacer::pipeline;

TEST(PipelineState, StateNames) {
    EXPECT_STREQ(pipelineStateToString(PipelineState::Idle), "idle");
    EXPECT_STREQ(pipelineStateToString(PipelineState::Listening), "listening");
    EXPECT_STREQ(pipelineStateToString(PipelineState::Recognizing), "recognizing");
    EXPECT_STREQ(pipelineStateToString(PipelineState::Synthesizing), "synthesizing");
    EXPECT_STREQ(pipelineStateToString(PipelineState::Speaking), "speaking");
    EXPECT_STREQ(pipelineStateToString(PipelineState::Error), "error");
}

TEST(PipelineState, HappyPathTransitions) {
    EXPECT_TRUE(isValidTransition(PipelineState::Idle, PipelineState::Listening));
    EXPECT_TRUE(isValidTransition(PipelineState::Listening, PipelineState::Recognizing));
    EXPECT_TRUE(isValidTransition(PipelineState::Recognizing, PipelineState::Synthesizing));
    EXPECT_TRUE(isValidTransition(PipelineState::Synthesizing, PipelineState::Speaking));
    EXPECT_TRUE(isValidTransition(PipelineState::Speaking, PipelineState::Listening));
}

TEST(PipelineState, FailureAndEmptyResultReturnToListening) {
    EXPECT_TRUE(isValidTransition(PipelineState::Recognizing, PipelineState::Listening));
    EXPECT_TRUE(isValidTransition(PipelineState::Synthesizing, PipelineState::Listening));
}

TEST(PipelineState, StopAndErrorReachableFromAnywhere) {
    for (auto from : {PipelineState::Idle, PipelineState::Listening, PipelineState::Recognizing,
                      PipelineState::Synthesizing, PipelineState::Speaking, PipelineState::Error}) {
        EXPECT_TRUE(isValidTransition(from, PipelineState::Idle));
        EXPECT_TRUE(isValidTransition(from, PipelineState::Error));
    }
}

TEST(PipelineState, InvalidTransitions) {
    EXPECT_FALSE(isValidTransition(PipelineState::Idle, PipelineState::Speaking));
    EXPECT_FALSE(isValidTransition(PipelineState::Listening, PipelineState::Speaking));
    EXPECT_FALSE(isValidTransition(PipelineState::Speaking, PipelineState::Recognizing));
    EXPECT_FALSE(isValidTransition(PipelineState::Error, PipelineState::Listening));
}

TEST(PipelineStatus, FlagsFollowState) {
    auto speaking = makeStatus(PipelineState::Speaking, 120.0, 0, "");
    EXPECT_TRUE(speaking.isSpeaking);
    EXPECT_FALSE(speaking.isProcessing);

    auto recognizing = makeStatus(PipelineState::Recognizing, 0.0, 0, "");
    EXPECT_TRUE(recognizing.isProcessing);
    EXPECT_FALSE(recognizing.isSpeaking);

    auto synthesizing = makeStatus(PipelineState::Synthesizing, 0.0, 0, "");
    EXPECT_TRUE(synthesizing.isProcessing);

    auto listening = makeStatus(PipelineState::Listening, 0.0, 3, "DEVICE_IO_FAILED: gone");
    EXPECT_FALSE(listening.isProcessing);
    EXPECT_FALSE(listening.isSpeaking);
    EXPECT_EQ(listening.droppedFrames, 3u);
    EXPECT_EQ(listening.lastError, "DEVICE_IO_FAILED: gone");
}

TEST(PipelineStatus, LatencyIsNeverNegative) {
    EXPECT_DOUBLE_EQ(makeStatus(PipelineState::Speaking, -5.0, 0, "").latencyMs, 0.0);
    EXPECT_DOUBLE_EQ(makeStatus(PipelineState::Speaking, 42.5, 0, "").latencyMs, 42.5);
}
