#pragma once

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>

namespace voice_replacer {
namespace pipeline {

struct PipelineStatsSnapshot {
    uint64_t framesCaptured{0};
    uint64_t framesDropped{0};
    uint64_t utterances{0};
    uint64_t utterancesAbandoned{0};
    uint64_t utterancesDropped{0};  // Discarded by the drop barge-in policy
    uint64_t recognitionFailures{0};
    uint64_t emptyRecognitions{0};
    uint64_t synthesisFailures{0};
    uint64_t playbackFailures{0};
    uint64_t responsesSpoken{0};
    uint64_t responsesInterrupted{0};
    double lastLatencyMs{0.0};
};

// Aggregates pipeline counters for the STATUS command and the shutdown summary
class PipelineStats {
   public:
    void setFrames(uint64_t captured, uint64_t dropped);
    void incrementUtterances();
    void incrementAbandoned();
    void incrementDropped();
    void incrementRecognitionFailures();
    void incrementEmptyRecognitions();
    void incrementSynthesisFailures();
    void incrementPlaybackFailures();
    void recordSpoken(bool completed);
    void setLastLatency(double latencyMs);
    void reset();

    PipelineStatsSnapshot snapshot() const;

   private:
    mutable std::mutex mutex_;
    PipelineStatsSnapshot stats_;
};

nlohmann::json statsToJson(const PipelineStatsSnapshot& stats);

}  // namespace pipeline
}  // namespace voice_replacer
