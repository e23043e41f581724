#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace voice_replacer {
namespace audio {

using Clock = std::chrono::steady_clock;

// One captured block of mono S16 PCM. Move-only: frames travel from the
// capture thread through the queue into the segmenter without copies.
struct Frame {
    std::vector<int16_t> samples;
    uint32_t sampleRate = 0;
    Clock::time_point timestamp{};
    uint64_t epoch = 0;  // Capture stream generation, bumped on device switch

    Frame() = default;
    Frame(std::vector<int16_t> pcm, uint32_t rate, Clock::time_point ts, uint64_t captureEpoch)
        : samples(std::move(pcm)), sampleRate(rate), timestamp(ts), epoch(captureEpoch) {}

    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;
    Frame(Frame&&) noexcept = default;
    Frame& operator=(Frame&&) noexcept = default;

    std::chrono::microseconds duration() const {
        if (sampleRate == 0) {
            return std::chrono::microseconds(0);
        }
        return std::chrono::microseconds(static_cast<int64_t>(samples.size()) * 1000000 /
                                         sampleRate);
    }
};

// Contiguous span of detected speech. Owned by the segmenter until it is
// handed to the recognizer.
struct Utterance {
    std::vector<Frame> frames;
    Clock::time_point start{};
    Clock::time_point end{};
    std::chrono::microseconds duration{0};
    uint32_t sampleRate = 0;
    bool forcedClose = false;  // Closed by the max-duration limit, not by silence

    Utterance() = default;
    Utterance(const Utterance&) = delete;
    Utterance& operator=(const Utterance&) = delete;
    Utterance(Utterance&&) noexcept = default;
    Utterance& operator=(Utterance&&) noexcept = default;

    size_t sampleCount() const {
        size_t total = 0;
        for (const auto& f : frames) {
            total += f.samples.size();
        }
        return total;
    }

    // Flattened PCM for engines that take one buffer
    std::vector<int16_t> pcm() const {
        std::vector<int16_t> out;
        out.reserve(sampleCount());
        for (const auto& f : frames) {
            out.insert(out.end(), f.samples.begin(), f.samples.end());
        }
        return out;
    }
};

// Segment of a synthesized waveform, owned by playback until rendered
struct AudioChunk {
    std::vector<int16_t> samples;
    uint32_t sampleRate = 0;
};

}  // namespace audio
}  // namespace voice_replacer
