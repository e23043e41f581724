#pragma once

#include "voice_replacer/audio/audio_capture.h"

#include <alsa/asoundlib.h>

namespace voice_replacer {
namespace audio {

// Mono S16_LE capture through snd_pcm_readi
class AlsaCaptureSource : public CaptureSource {
   public:
    AlsaCaptureSource() = default;
    ~AlsaCaptureSource() override;

    bool open(const std::string& pcmName, uint32_t sampleRate, uint32_t blockFrames) override;
    int read(std::vector<int16_t>& block) override;
    void close() override;
    bool isOpen() const override {
        return handle_ != nullptr;
    }

   private:
    snd_pcm_t* handle_{nullptr};
    std::string pcmName_;
    uint32_t sampleRate_{0};
    snd_pcm_uframes_t blockFrames_{0};
    int waitTimeoutMs_{0};
};

}  // namespace audio
}  // namespace voice_replacer
