#include "voice_replacer/tts/speech_synthesizer.h"

#include "voice_replacer/core/errors.h"
#include "voice_replacer/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#ifdef VOICE_REPLACER_ENABLE_PIPER
#include <optional>
#include <piper.hpp>
#endif

namespace voice_replacer {
namespace tts {
namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

#ifdef VOICE_REPLACER_ENABLE_PIPER

class PiperSynthesisEngine final : public SynthesisEngine {
   public:
    explicit PiperSynthesisEngine(AppConfig::SynthesizerConfig config)
        : config_(std::move(config)) {
        if (!config_.espeakDataPath.empty()) {
            piperConfig_.eSpeakDataPath = config_.espeakDataPath;
        }
    }

    ~PiperSynthesisEngine() override {
        if (initialized_) {
            voices_.clear();
            piper::terminate(piperConfig_);
        }
    }

    const char* name() const override {
        return "piper";
    }

    void loadVoice(const VoiceInfo& voice) override {
        if (hasVoice(voice.id)) {
            return;
        }
        if (!voice.installed) {
            throw ModelLoadError("voice model not installed: " + voice.modelPath.string(),
                                 ErrorCode::MODEL_NOT_FOUND);
        }
        auto loaded = std::make_unique<piper::Voice>();
        try {
            std::optional<piper::SpeakerId> speaker;
            piper::loadVoice(piperConfig_, voice.modelPath.string(), voice.configPath.string(),
                             *loaded, speaker, config_.useCuda);
            if (!initialized_) {
                piper::initialize(piperConfig_);
                initialized_ = true;
            }
        } catch (const std::exception& e) {
            throw ModelLoadError("piper failed to load " + voice.id + ": " + e.what());
        }
        voices_[voice.id] = std::move(loaded);
    }

    bool hasVoice(const std::string& voiceId) const override {
        return voices_.count(voiceId) != 0;
    }

    Waveform synthesize(const std::string& voiceId, const std::string& text,
                        float speed) override {
        auto it = voices_.find(voiceId);
        if (it == voices_.end()) {
            throw SynthesisError("voice not loaded: " + voiceId,
                                 ErrorCode::SYNTHESIS_UNKNOWN_VOICE);
        }
        piper::Voice& voice = *it->second;
        // Piper length scale is the inverse of speaking rate
        voice.synthesisConfig.lengthScale = 1.0f / speed;

        Waveform waveform;
        piper::SynthesisResult result;
        try {
            piper::textToAudio(piperConfig_, voice, text, waveform.samples, result, nullptr);
        } catch (const std::exception& e) {
            throw SynthesisError(std::string("piper synthesis failed: ") + e.what());
        }
        waveform.sampleRate = static_cast<uint32_t>(voice.synthesisConfig.sampleRate);
        LOG_DEBUG("[Synthesizer] piper: {:.1f} ms, RTF {:.3f}", result.inferSeconds * 1000.0,
                  result.realTimeFactor);
        return waveform;
    }

   private:
    AppConfig::SynthesizerConfig config_;
    piper::PiperConfig piperConfig_;
    std::map<std::string, std::unique_ptr<piper::Voice>> voices_;
    bool initialized_ = false;
};

#else  // VOICE_REPLACER_ENABLE_PIPER

class PiperSynthesisEngine final : public SynthesisEngine {
   public:
    explicit PiperSynthesisEngine(const AppConfig::SynthesizerConfig& /*config*/) {}

    const char* name() const override {
        return "piper";
    }

    void loadVoice(const VoiceInfo& /*voice*/) override {
        throw ModelLoadError(
            "Piper synthesizer is not enabled at build time (rebuild with "
            "VOICE_REPLACER_ENABLE_PIPER=ON)",
            ErrorCode::MODEL_ENGINE_UNAVAILABLE);
    }

    bool hasVoice(const std::string& /*voiceId*/) const override {
        return false;
    }

    Waveform synthesize(const std::string& voiceId, const std::string& /*text*/,
                        float /*speed*/) override {
        throw SynthesisError("voice not loaded: " + voiceId, ErrorCode::SYNTHESIS_UNKNOWN_VOICE);
    }
};

#endif  // VOICE_REPLACER_ENABLE_PIPER

}  // namespace

SynthesisRequest::SynthesisRequest(std::string text, std::string voiceId, float speed)
    : text_(std::move(text)), voiceId_(std::move(voiceId)), speed_(speed) {
    if (!isValidSpeed(speed)) {
        throw SynthesisError("speed " + std::to_string(speed) + " outside [" +
                                 std::to_string(kMinSpeed) + ", " + std::to_string(kMaxSpeed) +
                                 "]",
                             ErrorCode::SYNTHESIS_INVALID_SPEED);
    }
}

bool SynthesisRequest::isValidSpeed(float speed) {
    return std::isfinite(speed) && speed >= kMinSpeed && speed <= kMaxSpeed;
}

std::vector<audio::AudioChunk> Waveform::toChunks(size_t chunkFrames) const {
    std::vector<audio::AudioChunk> chunks;
    if (samples.empty()) {
        return chunks;
    }
    if (chunkFrames == 0) {
        chunkFrames = samples.size();
    }
    for (size_t offset = 0; offset < samples.size(); offset += chunkFrames) {
        const size_t count = std::min(chunkFrames, samples.size() - offset);
        audio::AudioChunk chunk;
        chunk.sampleRate = sampleRate;
        chunk.samples.assign(samples.begin() + static_cast<std::ptrdiff_t>(offset),
                             samples.begin() + static_cast<std::ptrdiff_t>(offset + count));
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

SpeechSynthesizer::SpeechSynthesizer(std::unique_ptr<SynthesisEngine> engine,
                                     VoiceCatalog catalog)
    : engine_(std::move(engine)), catalog_(std::move(catalog)) {}

void SpeechSynthesizer::initialize(const std::string& voiceId, const Progress& progress) {
    std::lock_guard<std::mutex> lock(engineMutex_);
    if (progress) {
        progress(0.0f);
    }
    auto voice = catalog_.find(voiceId);
    if (!voice) {
        throw ModelLoadError("unknown voice '" + voiceId + "'", ErrorCode::MODEL_NOT_FOUND);
    }
    LOG_INFO("[Synthesizer] Loading {} voice {} ({})", engine_->name(), voiceId,
             voice->description);
    engine_->loadVoice(*voice);
    ready_.store(true, std::memory_order_release);
    if (progress) {
        progress(1.0f);
    }
}

void SpeechSynthesizer::ensureVoice(const std::string& voiceId) {
    if (engine_->hasVoice(voiceId)) {
        return;
    }
    auto voice = catalog_.find(voiceId);
    if (!voice) {
        throw SynthesisError("unknown voice '" + voiceId + "'",
                             ErrorCode::SYNTHESIS_UNKNOWN_VOICE);
    }
    LOG_INFO("[Synthesizer] Switching to voice {}", voiceId);
    try {
        engine_->loadVoice(*voice);
    } catch (const ModelLoadError& e) {
        throw SynthesisError(std::string("cannot load voice: ") + e.what(),
                             ErrorCode::SYNTHESIS_UNKNOWN_VOICE);
    }
}

Waveform SpeechSynthesizer::synthesize(const SynthesisRequest& request) {
    if (isBlank(request.text())) {
        return Waveform{};
    }

    std::lock_guard<std::mutex> lock(engineMutex_);
    ensureVoice(request.voiceId());
    engineCalls_.fetch_add(1, std::memory_order_relaxed);
    Waveform waveform = engine_->synthesize(request.voiceId(), request.text(), request.speed());
    LOG_DEBUG("[Synthesizer] '{}' -> {} samples @ {} Hz", request.text(),
              waveform.samples.size(), waveform.sampleRate);
    return waveform;
}

std::unique_ptr<SynthesisEngine> createSynthesisEngine(const AppConfig::SynthesizerConfig& config) {
    return std::make_unique<PiperSynthesisEngine>(config);
}

}  // namespace tts
}  // namespace voice_replacer
