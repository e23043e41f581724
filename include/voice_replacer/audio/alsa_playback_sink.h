#pragma once

#include "voice_replacer/audio/audio_playback.h"

#include <alsa/asoundlib.h>

namespace voice_replacer {
namespace audio {

// Mono S16_LE playback through snd_pcm_writei with EPIPE recovery
class AlsaPlaybackSink : public PlaybackSink {
   public:
    AlsaPlaybackSink() = default;
    ~AlsaPlaybackSink() override;

    bool open(const std::string& pcmName, uint32_t sampleRate, uint32_t periodFrames,
              uint32_t periods) override;
    bool write(const int16_t* samples, size_t count) override;
    size_t queuedFrames() override;
    void drop() override;
    void close() override;
    bool isOpen() const override {
        return handle_ != nullptr;
    }
    uint32_t sampleRate() const override {
        return sampleRate_;
    }

   private:
    bool configureHardware(uint32_t sampleRate, uint32_t periodFrames, uint32_t periods);
    bool recoverFromXrun();

    snd_pcm_t* handle_{nullptr};
    std::string pcmName_;
    uint32_t sampleRate_{0};
    snd_pcm_uframes_t periodSize_{0};
    snd_pcm_uframes_t bufferSize_{0};
};

}  // namespace audio
}  // namespace voice_replacer
