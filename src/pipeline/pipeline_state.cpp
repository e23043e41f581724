#include "voice_replacer/pipeline/pipeline_state.h"

#include <utility>

namespace voice_replacer {
namespace pipeline {

const char* pipelineStateToString(PipelineState state) {
    switch (state) {
    case PipelineState::Idle:
        return "idle";
    case PipelineState::Listening:
        return "listening";
    case PipelineState::Recognizing:
        return "recognizing";
    case PipelineState::Synthesizing:
        return "synthesizing";
    case PipelineState::Speaking:
        return "speaking";
    case PipelineState::Error:
        return "error";
    }
    return "unknown";
}

bool isValidTransition(PipelineState from, PipelineState to) {
    if (to == PipelineState::Idle || to == PipelineState::Error) {
        return true;
    }
    switch (from) {
    case PipelineState::Idle:
        return to == PipelineState::Listening;
    case PipelineState::Listening:
        return to == PipelineState::Recognizing;
    case PipelineState::Recognizing:
        return to == PipelineState::Synthesizing || to == PipelineState::Listening;
    case PipelineState::Synthesizing:
        return to == PipelineState::Speaking || to == PipelineState::Listening;
    case PipelineState::Speaking:
        return to == PipelineState::Listening;
    case PipelineState::Error:
        return false;
    }
    return false;
}

PipelineStatus makeStatus(PipelineState state, double latencyMs, uint64_t droppedFrames,
                          std::string lastError) {
    PipelineStatus status;
    status.state = state;
    status.isSpeaking = state == PipelineState::Speaking;
    status.isProcessing =
        state == PipelineState::Recognizing || state == PipelineState::Synthesizing;
    status.latencyMs = latencyMs < 0.0 ? 0.0 : latencyMs;
    status.droppedFrames = droppedFrames;
    status.lastError = std::move(lastError);
    return status;
}

}  // namespace pipeline
}  // namespace voice_replacer
