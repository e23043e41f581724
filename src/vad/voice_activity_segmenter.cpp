#include "voice_replacer/vad/voice_activity_segmenter.h"

#include "voice_replacer/logging/logger.h"

#include <cmath>
#include <utility>

namespace voice_replacer {
namespace vad {

VoiceActivitySegmenter::VoiceActivitySegmenter(SegmenterConfig config) : config_(config) {
    if (config_.onsetFrames < 1) {
        config_.onsetFrames = 1;
    }
    if (config_.hangoverFrames < 1) {
        config_.hangoverFrames = 1;
    }
    if (config_.smoothing <= 0.0f || config_.smoothing > 1.0f) {
        config_.smoothing = 1.0f;
    }
}

float VoiceActivitySegmenter::rms(const audio::Frame& frame) {
    if (frame.samples.empty()) {
        return 0.0f;
    }
    double sum = 0.0;
    for (int16_t s : frame.samples) {
        const double v = static_cast<double>(s) / 32768.0;
        sum += v * v;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(frame.samples.size())));
}

std::optional<SegmenterEvent> VoiceActivitySegmenter::process(audio::Frame frame) {
    const float energy = rms(frame);
    if (!primed_) {
        smoothed_ = energy;
        primed_ = true;
    } else {
        smoothed_ = config_.smoothing * energy + (1.0f - config_.smoothing) * smoothed_;
    }
    const bool speech = smoothed_ >= config_.threshold;

    if (!active_) {
        if (!speech) {
            aboveCount_ = 0;
            onsetFrames_.clear();
            return std::nullopt;
        }
        ++aboveCount_;
        onsetFrames_.push_back(std::move(frame));
        if (aboveCount_ < config_.onsetFrames) {
            return std::nullopt;
        }

        // Onset confirmed: held frames open the utterance
        active_ = true;
        belowCount_ = 0;
        aboveCount_ = 0;
        current_ = audio::Utterance{};
        current_.start = onsetFrames_.front().timestamp;
        current_.sampleRate = onsetFrames_.front().sampleRate;
        for (auto& held : onsetFrames_) {
            current_.duration += held.duration();
            current_.end = held.timestamp + held.duration();
            current_.frames.push_back(std::move(held));
        }
        onsetFrames_.clear();
        LOG_DEBUG("[VAS] Utterance started (energy {:.4f})", smoothed_);
        return SegmenterEvent{SegmenterEventType::UtteranceStarted, audio::Utterance{}};
    }

    current_.duration += frame.duration();
    current_.end = frame.timestamp + frame.duration();
    current_.frames.push_back(std::move(frame));

    belowCount_ = speech ? 0 : belowCount_ + 1;

    const auto maxDuration = std::chrono::milliseconds(config_.maxUtteranceMs);
    if (current_.duration >= maxDuration) {
        LOG_DEBUG("[VAS] Utterance force-closed at {} ms", config_.maxUtteranceMs);
        return SegmenterEvent{SegmenterEventType::UtteranceEnded, closeUtterance(true)};
    }
    if (belowCount_ >= config_.hangoverFrames) {
        return SegmenterEvent{SegmenterEventType::UtteranceEnded, closeUtterance(false)};
    }
    return std::nullopt;
}

audio::Utterance VoiceActivitySegmenter::closeUtterance(bool forced) {
    audio::Utterance done = std::move(current_);
    done.forcedClose = forced;
    current_ = audio::Utterance{};
    active_ = false;
    belowCount_ = 0;
    aboveCount_ = 0;
    LOG_DEBUG("[VAS] Utterance ended: {} frames, {} ms{}", done.frames.size(),
              std::chrono::duration_cast<std::chrono::milliseconds>(done.duration).count(),
              forced ? " (max duration)" : "");
    return done;
}

void VoiceActivitySegmenter::abandon() {
    if (active_) {
        ++abandoned_;
        LOG_DEBUG("[VAS] Utterance abandoned after {} frames", current_.frames.size());
    }
    current_ = audio::Utterance{};
    onsetFrames_.clear();
    active_ = false;
    primed_ = false;
    smoothed_ = 0.0f;
    aboveCount_ = 0;
    belowCount_ = 0;
}

}  // namespace vad
}  // namespace voice_replacer
