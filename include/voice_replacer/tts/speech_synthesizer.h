#pragma once

#include "voice_replacer/audio/frame.h"
#include "voice_replacer/core/config_loader.h"
#include "voice_replacer/tts/voice_catalog.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voice_replacer {
namespace tts {

// Immutable synthesis input. The speed range is enforced here.
class SynthesisRequest {
   public:
    // @throws SynthesisError (SYNTHESIS_INVALID_SPEED) outside [kMinSpeed, kMaxSpeed]
    SynthesisRequest(std::string text, std::string voiceId, float speed);

    const std::string& text() const {
        return text_;
    }
    const std::string& voiceId() const {
        return voiceId_;
    }
    float speed() const {
        return speed_;
    }

    static bool isValidSpeed(float speed);

   private:
    std::string text_;
    std::string voiceId_;
    float speed_;
};

struct Waveform {
    std::vector<int16_t> samples;
    uint32_t sampleRate = 0;

    bool empty() const {
        return samples.empty();
    }
    // Split into playback chunks of at most chunkFrames samples
    std::vector<audio::AudioChunk> toChunks(size_t chunkFrames) const;
};

// Engine seam. Implementations keep every voice they loaded.
class SynthesisEngine {
   public:
    virtual ~SynthesisEngine() = default;

    virtual const char* name() const = 0;
    // @throws ModelLoadError
    virtual void loadVoice(const VoiceInfo& voice) = 0;
    virtual bool hasVoice(const std::string& voiceId) const = 0;
    // @throws SynthesisError
    virtual Waveform synthesize(const std::string& voiceId, const std::string& text,
                                float speed) = 0;
};

/**
 * @brief Text to waveform for the selected voice.
 *
 * Blocking; called from the synthesis+playback worker only. Whitespace-only
 * text returns an empty waveform without touching the engine.
 */
class SpeechSynthesizer {
   public:
    using Progress = std::function<void(float fraction)>;

    SpeechSynthesizer(std::unique_ptr<SynthesisEngine> engine, VoiceCatalog catalog);

    // Load the voice used first. @throws ModelLoadError
    void initialize(const std::string& voiceId, const Progress& progress = {});
    bool isReady() const {
        return ready_.load(std::memory_order_acquire);
    }

    // @throws SynthesisError (unknown voice, load failure, engine fault)
    Waveform synthesize(const SynthesisRequest& request);

    std::map<std::string, VoiceInfo> listVoices() const {
        return catalog_.listVoices();
    }
    const VoiceCatalog& catalog() const {
        return catalog_;
    }
    uint64_t engineCalls() const {
        return engineCalls_.load(std::memory_order_relaxed);
    }

   private:
    void ensureVoice(const std::string& voiceId);

    std::unique_ptr<SynthesisEngine> engine_;
    VoiceCatalog catalog_;
    std::mutex engineMutex_;
    std::atomic<bool> ready_{false};
    std::atomic<uint64_t> engineCalls_{0};
};

// Piper engine when built with VOICE_REPLACER_ENABLE_PIPER; otherwise an
// engine whose loadVoice() fails with MODEL_ENGINE_UNAVAILABLE
std::unique_ptr<SynthesisEngine> createSynthesisEngine(const AppConfig::SynthesizerConfig& config);

}  // namespace tts
}  // namespace voice_replacer
