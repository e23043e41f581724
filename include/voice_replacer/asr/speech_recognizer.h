#pragma once

#include "voice_replacer/audio/frame.h"
#include "voice_replacer/core/config_loader.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace voice_replacer {
namespace asr {

struct RecognitionResult {
    std::string text;
    bool isFinal = false;
    std::optional<float> confidence;
};

// Decoder seam. One decode session runs between reset() calls.
class RecognitionEngine {
   public:
    virtual ~RecognitionEngine() = default;

    virtual const char* name() const = 0;

    // @throws ModelLoadError
    virtual void load(const std::string& modelPath, uint32_t sampleRate) = 0;
    virtual bool isLoaded() const = 0;

    /**
     * Feed PCM into the current session.
     * @return a partial hypothesis when the engine has a new one
     * @throws RecognitionError
     */
    virtual std::optional<RecognitionResult> accept(const int16_t* samples, size_t count) = 0;

    // Close the session and return its final result. @throws RecognitionError
    virtual RecognitionResult finish() = 0;

    // Drop all session state
    virtual void reset() = 0;
};

/**
 * @brief Decodes one Utterance at a time into text.
 *
 * recognize() returns zero or more partials followed by exactly one final
 * result (whose text may be empty). The engine is reset after every decode,
 * including failed ones.
 */
class SpeechRecognizer {
   public:
    SpeechRecognizer(std::unique_ptr<RecognitionEngine> engine, std::string modelPath,
                     uint32_t sampleRate);

    // Load the model. @throws ModelLoadError
    void initialize();
    bool isReady() const;

    // @throws RecognitionError, ModelLoadError (model not loaded)
    std::vector<RecognitionResult> recognize(audio::Utterance utterance);

    const std::string& modelPath() const {
        return modelPath_;
    }
    const char* engineName() const {
        return engine_->name();
    }

    // Text of the final result, trimmed; empty when there is none
    static std::string finalText(const std::vector<RecognitionResult>& results);

   private:
    std::unique_ptr<RecognitionEngine> engine_;
    std::string modelPath_;
    uint32_t sampleRate_;
};

// Vosk engine when built with VOICE_REPLACER_ENABLE_VOSK; otherwise an engine
// whose load() fails with MODEL_ENGINE_UNAVAILABLE
std::unique_ptr<RecognitionEngine> createRecognitionEngine(
    const AppConfig::RecognizerConfig& config);

}  // namespace asr
}  // namespace voice_replacer
