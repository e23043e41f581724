#include "voice_replacer/asr/speech_recognizer.h"

#include "voice_replacer/core/errors.h"
#include "voice_replacer/logging/logger.h"

#include <cctype>
#include <filesystem>
#include <utility>

#ifdef VOICE_REPLACER_ENABLE_VOSK
#include <nlohmann/json.hpp>
#include <vosk_api.h>
#endif

namespace voice_replacer {
namespace asr {
namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

#ifdef VOICE_REPLACER_ENABLE_VOSK

struct VoskModelDeleter {
    void operator()(VoskModel* p) const {
        if (p) {
            vosk_model_free(p);
        }
    }
};
struct VoskRecognizerDeleter {
    void operator()(VoskRecognizer* p) const {
        if (p) {
            vosk_recognizer_free(p);
        }
    }
};

class VoskRecognitionEngine final : public RecognitionEngine {
   public:
    explicit VoskRecognitionEngine(int logLevel) {
        vosk_set_log_level(logLevel);
    }

    const char* name() const override {
        return "vosk";
    }

    void load(const std::string& modelPath, uint32_t sampleRate) override {
        if (!std::filesystem::exists(modelPath)) {
            throw ModelLoadError("recognizer model not found: " + modelPath,
                                 ErrorCode::MODEL_NOT_FOUND);
        }
        model_.reset(vosk_model_new(modelPath.c_str()));
        if (!model_) {
            throw ModelLoadError("vosk_model_new failed for " + modelPath);
        }
        recognizer_.reset(vosk_recognizer_new(model_.get(), static_cast<float>(sampleRate)));
        if (!recognizer_) {
            model_.reset();
            throw ModelLoadError("vosk_recognizer_new failed");
        }
        vosk_recognizer_set_words(recognizer_.get(), 1);
    }

    bool isLoaded() const override {
        return recognizer_ != nullptr;
    }

    std::optional<RecognitionResult> accept(const int16_t* samples, size_t count) override {
        int rc = vosk_recognizer_accept_waveform_s(recognizer_.get(),
                                                   reinterpret_cast<const short*>(samples),
                                                   static_cast<int>(count));
        if (rc < 0) {
            throw RecognitionError("vosk_recognizer_accept_waveform_s failed");
        }
        if (rc == 1) {
            // Engine found an endpoint inside the utterance: bank that segment
            appendSegment(parse(vosk_recognizer_result(recognizer_.get()), "text"));
            return std::nullopt;
        }
        RecognitionResult partial = parse(vosk_recognizer_partial_result(recognizer_.get()),
                                          "partial");
        if (partial.text.empty() || partial.text == lastPartial_) {
            return std::nullopt;
        }
        lastPartial_ = partial.text;
        partial.text = joined(partial.text);
        return partial;
    }

    RecognitionResult finish() override {
        appendSegment(parse(vosk_recognizer_final_result(recognizer_.get()), "text"));
        RecognitionResult result;
        result.isFinal = true;
        result.text = joined("");
        if (confidenceCount_ > 0) {
            result.confidence = confidenceSum_ / static_cast<float>(confidenceCount_);
        }
        return result;
    }

    void reset() override {
        if (recognizer_) {
            vosk_recognizer_reset(recognizer_.get());
        }
        segments_.clear();
        lastPartial_.clear();
        confidenceSum_ = 0.0f;
        confidenceCount_ = 0;
    }

   private:
    RecognitionResult parse(const char* json, const char* key) {
        RecognitionResult result;
        if (!json) {
            throw RecognitionError("vosk returned no result");
        }
        try {
            auto j = nlohmann::json::parse(json);
            if (j.contains(key) && j[key].is_string()) {
                result.text = trim(j[key].get<std::string>());
            }
            if (j.contains("result") && j["result"].is_array()) {
                for (const auto& word : j["result"]) {
                    if (word.contains("conf") && word["conf"].is_number()) {
                        confidenceSum_ += word["conf"].get<float>();
                        ++confidenceCount_;
                    }
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw RecognitionError(std::string("malformed vosk result: ") + e.what());
        }
        return result;
    }

    void appendSegment(const RecognitionResult& segment) {
        if (!segment.text.empty()) {
            segments_.push_back(segment.text);
        }
        lastPartial_.clear();
    }

    std::string joined(const std::string& tail) const {
        std::string text;
        for (const auto& s : segments_) {
            if (!text.empty()) {
                text += ' ';
            }
            text += s;
        }
        if (!tail.empty()) {
            if (!text.empty()) {
                text += ' ';
            }
            text += tail;
        }
        return text;
    }

    std::unique_ptr<VoskModel, VoskModelDeleter> model_;
    std::unique_ptr<VoskRecognizer, VoskRecognizerDeleter> recognizer_;
    std::vector<std::string> segments_;
    std::string lastPartial_;
    float confidenceSum_ = 0.0f;
    int confidenceCount_ = 0;
};

#else  // VOICE_REPLACER_ENABLE_VOSK

class VoskRecognitionEngine final : public RecognitionEngine {
   public:
    explicit VoskRecognitionEngine(int /*logLevel*/) {}

    const char* name() const override {
        return "vosk";
    }

    void load(const std::string& /*modelPath*/, uint32_t /*sampleRate*/) override {
        throw ModelLoadError(
            "Vosk recognizer is not enabled at build time (rebuild with "
            "VOICE_REPLACER_ENABLE_VOSK=ON)",
            ErrorCode::MODEL_ENGINE_UNAVAILABLE);
    }

    bool isLoaded() const override {
        return false;
    }

    std::optional<RecognitionResult> accept(const int16_t* /*samples*/,
                                            size_t /*count*/) override {
        throw RecognitionError("no recognizer engine", ErrorCode::RECOGNITION_MODEL_UNAVAILABLE);
    }

    RecognitionResult finish() override {
        throw RecognitionError("no recognizer engine", ErrorCode::RECOGNITION_MODEL_UNAVAILABLE);
    }

    void reset() override {}
};

#endif  // VOICE_REPLACER_ENABLE_VOSK

// Resets the engine when a decode leaves scope, successful or not
class SessionGuard {
   public:
    explicit SessionGuard(RecognitionEngine& engine) : engine_(engine) {}
    ~SessionGuard() {
        engine_.reset();
    }

   private:
    RecognitionEngine& engine_;
};

}  // namespace

SpeechRecognizer::SpeechRecognizer(std::unique_ptr<RecognitionEngine> engine,
                                   std::string modelPath, uint32_t sampleRate)
    : engine_(std::move(engine)), modelPath_(std::move(modelPath)), sampleRate_(sampleRate) {}

void SpeechRecognizer::initialize() {
    if (engine_->isLoaded()) {
        return;
    }
    LOG_INFO("[Recognizer] Loading {} model from {}", engine_->name(), modelPath_);
    engine_->load(modelPath_, sampleRate_);
    LOG_INFO("[Recognizer] Model ready ({} Hz)", sampleRate_);
}

bool SpeechRecognizer::isReady() const {
    return engine_->isLoaded();
}

std::vector<RecognitionResult> SpeechRecognizer::recognize(audio::Utterance utterance) {
    if (!engine_->isLoaded()) {
        throw ModelLoadError("recognizer model is not loaded",
                             ErrorCode::RECOGNITION_MODEL_UNAVAILABLE);
    }
    if (utterance.sampleRate != 0 && utterance.sampleRate != sampleRate_) {
        throw RecognitionError("utterance at " + std::to_string(utterance.sampleRate) +
                                   " Hz, recognizer expects " + std::to_string(sampleRate_),
                               ErrorCode::RECOGNITION_INVALID_AUDIO);
    }

    SessionGuard guard(*engine_);
    std::vector<RecognitionResult> results;
    for (const auto& frame : utterance.frames) {
        if (frame.samples.empty()) {
            continue;
        }
        if (auto partial = engine_->accept(frame.samples.data(), frame.samples.size())) {
            partial->isFinal = false;
            results.push_back(std::move(*partial));
        }
    }

    RecognitionResult finalResult = engine_->finish();
    finalResult.isFinal = true;
    finalResult.text = trim(finalResult.text);
    LOG_DEBUG("[Recognizer] {} partials, final '{}'", results.size(), finalResult.text);
    results.push_back(std::move(finalResult));
    return results;
}

std::string SpeechRecognizer::finalText(const std::vector<RecognitionResult>& results) {
    for (auto it = results.rbegin(); it != results.rend(); ++it) {
        if (it->isFinal) {
            return trim(it->text);
        }
    }
    return "";
}

std::unique_ptr<RecognitionEngine> createRecognitionEngine(
    const AppConfig::RecognizerConfig& config) {
    return std::make_unique<VoskRecognitionEngine>(config.engineLogLevel);
}

}  // namespace asr
}  // namespace voice_replacer
