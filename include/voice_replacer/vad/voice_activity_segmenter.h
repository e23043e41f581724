/**
 * @file voice_activity_segmenter.h
 * @brief Energy-based utterance segmentation with onset/hangover hysteresis
 */

#pragma once

#include "voice_replacer/audio/frame.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace voice_replacer {
namespace vad {

struct SegmenterConfig {
    float threshold = 0.015f;  // Smoothed normalized RMS that counts as speech
    float smoothing = 0.4f;    // EMA weight of the newest frame (1.0 = no smoothing)
    int onsetFrames = 3;
    int hangoverFrames = 25;
    int maxUtteranceMs = 15000;
};

enum class SegmenterEventType { UtteranceStarted, UtteranceEnded };

struct SegmenterEvent {
    SegmenterEventType type;
    audio::Utterance utterance;  // Only populated for UtteranceEnded
};

/**
 * @brief Turns a stream of Frames into Utterances.
 *
 * Per frame: normalized RMS, smoothed by an exponential moving average.
 * - Idle: frames above threshold are held back; after onsetFrames in a row
 *   UtteranceStarted is emitted and the held frames open the utterance.
 * - Active: every frame is appended. After hangoverFrames consecutive frames
 *   below threshold, or once maxUtteranceMs is reached, UtteranceEnded
 *   carries the utterance out by move.
 *
 * Not thread-safe; owned by the segmentation worker.
 */
class VoiceActivitySegmenter {
   public:
    explicit VoiceActivitySegmenter(SegmenterConfig config = {});

    // At most one event per frame
    std::optional<SegmenterEvent> process(audio::Frame frame);

    // Discard any utterance under construction and reset the energy estimate
    void abandon();

    bool inUtterance() const {
        return active_;
    }
    float smoothedEnergy() const {
        return smoothed_;
    }
    const SegmenterConfig& config() const {
        return config_;
    }
    uint64_t abandonedCount() const {
        return abandoned_;
    }

    // Normalized RMS (0..1) of S16 samples
    static float rms(const audio::Frame& frame);

   private:
    audio::Utterance closeUtterance(bool forced);

    SegmenterConfig config_;
    float smoothed_ = 0.0f;
    bool primed_ = false;  // EMA seeded by the first frame
    bool active_ = false;
    int aboveCount_ = 0;
    int belowCount_ = 0;
    std::deque<audio::Frame> onsetFrames_;
    audio::Utterance current_;
    uint64_t abandoned_ = 0;
};

}  // namespace vad
}  // namespace voice_replacer
