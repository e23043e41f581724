#pragma once

#include <cstdint>
#include <string>

namespace voice_replacer {
namespace pipeline {

enum class PipelineState { Idle, Listening, Recognizing, Synthesizing, Speaking, Error };

const char* pipelineStateToString(PipelineState state);

// Transitions of the controller state machine. stop() (-> Idle) is allowed
// from every state and handled separately.
bool isValidTransition(PipelineState from, PipelineState to);

// Read-only snapshot handed to presenters
struct PipelineStatus {
    PipelineState state = PipelineState::Idle;
    bool isSpeaking = false;    // A response is being rendered to the output device
    bool isProcessing = false;  // Recognizing or Synthesizing
    double latencyMs = 0.0;     // Utterance end -> first output sample of the last response
    uint64_t droppedFrames = 0;
    std::string lastError;
};

PipelineStatus makeStatus(PipelineState state, double latencyMs, uint64_t droppedFrames,
                          std::string lastError);

}  // namespace pipeline
}  // namespace voice_replacer
