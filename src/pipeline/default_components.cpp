#include "voice_replacer/audio/alsa_capture_source.h"
#include "voice_replacer/audio/alsa_device_backend.h"
#include "voice_replacer/audio/alsa_playback_sink.h"
#include "voice_replacer/logging/logger.h"
#include "voice_replacer/pipeline/pipeline_controller.h"

namespace voice_replacer {
namespace pipeline {

PipelineComponents createDefaultComponents(const AppConfig& config) {
    PipelineComponents components;
    components.deviceBackend = std::make_shared<audio::AlsaDeviceBackend>();
    components.captureSource = std::make_unique<audio::AlsaCaptureSource>();
    components.playbackSink = std::make_unique<audio::AlsaPlaybackSink>();
    components.recognitionEngine = asr::createRecognitionEngine(config.recognizer);
    components.synthesisEngine = tts::createSynthesisEngine(config.synthesizer);
    LOG_DEBUG("[Pipeline] Components: ALSA audio, {} recognizer, {} synthesizer",
              components.recognitionEngine->name(), components.synthesisEngine->name());
    return components;
}

}  // namespace pipeline
}  // namespace voice_replacer
