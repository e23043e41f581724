#include "voice_replacer/pipeline/pipeline_stats.h"

namespace voice_replacer {
namespace pipeline {

void PipelineStats::setFrames(uint64_t captured, uint64_t dropped) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.framesCaptured = captured;
    stats_.framesDropped = dropped;
}

void PipelineStats::incrementUtterances() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.utterances;
}

void PipelineStats::incrementAbandoned() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.utterancesAbandoned;
}

void PipelineStats::incrementDropped() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.utterancesDropped;
}

void PipelineStats::incrementRecognitionFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.recognitionFailures;
}

void PipelineStats::incrementEmptyRecognitions() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.emptyRecognitions;
}

void PipelineStats::incrementSynthesisFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.synthesisFailures;
}

void PipelineStats::incrementPlaybackFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.playbackFailures;
}

void PipelineStats::recordSpoken(bool completed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed) {
        ++stats_.responsesSpoken;
    } else {
        ++stats_.responsesInterrupted;
    }
}

void PipelineStats::setLastLatency(double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.lastLatencyMs = latencyMs;
}

void PipelineStats::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = PipelineStatsSnapshot{};
}

PipelineStatsSnapshot PipelineStats::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

nlohmann::json statsToJson(const PipelineStatsSnapshot& stats) {
    nlohmann::json j;
    j["frames"] = {{"captured", stats.framesCaptured}, {"dropped", stats.framesDropped}};
    j["utterances"] = {{"completed", stats.utterances},
                       {"abandoned", stats.utterancesAbandoned},
                       {"dropped", stats.utterancesDropped}};
    j["recognition"] = {{"failures", stats.recognitionFailures},
                        {"empty", stats.emptyRecognitions}};
    j["synthesis"] = {{"failures", stats.synthesisFailures}};
    j["playback"] = {{"failures", stats.playbackFailures},
                     {"spoken", stats.responsesSpoken},
                     {"interrupted", stats.responsesInterrupted}};
    j["last_latency_ms"] = stats.lastLatencyMs;
    return j;
}

}  // namespace pipeline
}  // namespace voice_replacer
