#include "voice_replacer/audio/alsa_playback_sink.h"

#include "voice_replacer/logging/logger.h"

#include <chrono>
#include <memory>
#include <thread>

namespace voice_replacer {
namespace audio {

namespace {

struct HwParamsDeleter {
    void operator()(snd_pcm_hw_params_t* p) const {
        if (p) {
            snd_pcm_hw_params_free(p);
        }
    }
};

}  // namespace

AlsaPlaybackSink::~AlsaPlaybackSink() {
    close();
}

bool AlsaPlaybackSink::configureHardware(uint32_t sampleRate, uint32_t periodFrames,
                                         uint32_t periods) {
    std::unique_ptr<snd_pcm_hw_params_t, HwParamsDeleter> params;
    snd_pcm_hw_params_t* raw = nullptr;
    snd_pcm_hw_params_malloc(&raw);
    params.reset(raw);
    if (!params) {
        LOG_ERROR("[AlsaPlayback] failed to alloc hw_params");
        return false;
    }

    if (snd_pcm_hw_params_any(handle_, params.get()) < 0) {
        LOG_ERROR("[AlsaPlayback] snd_pcm_hw_params_any failed");
        return false;
    }
    if (snd_pcm_hw_params_set_access(handle_, params.get(), SND_PCM_ACCESS_RW_INTERLEAVED) < 0) {
        LOG_ERROR("[AlsaPlayback] failed to set access");
        return false;
    }
    if (snd_pcm_hw_params_set_format(handle_, params.get(), SND_PCM_FORMAT_S16_LE) < 0) {
        LOG_ERROR("[AlsaPlayback] device does not support S16_LE");
        return false;
    }
    if (snd_pcm_hw_params_set_channels(handle_, params.get(), 1) < 0) {
        LOG_ERROR("[AlsaPlayback] device does not support mono (use a plug: device)");
        return false;
    }
    snd_pcm_hw_params_set_rate_resample(handle_, params.get(), 1);

    unsigned int rate = sampleRate;
    if (snd_pcm_hw_params_set_rate_near(handle_, params.get(), &rate, nullptr) < 0) {
        LOG_ERROR("[AlsaPlayback] failed to set rate={}", sampleRate);
        return false;
    }
    if (rate != sampleRate) {
        LOG_ERROR("[AlsaPlayback] rate mismatch (requested {}, got {})", sampleRate, rate);
        return false;
    }

    snd_pcm_uframes_t period = periodFrames;
    if (snd_pcm_hw_params_set_period_size_near(handle_, params.get(), &period, nullptr) < 0) {
        LOG_ERROR("[AlsaPlayback] failed to set period size");
        return false;
    }
    snd_pcm_uframes_t buffer = period * periods;
    if (snd_pcm_hw_params_set_buffer_size_near(handle_, params.get(), &buffer) < 0) {
        LOG_ERROR("[AlsaPlayback] failed to set buffer size");
        return false;
    }
    if (snd_pcm_hw_params(handle_, params.get()) < 0) {
        LOG_ERROR("[AlsaPlayback] snd_pcm_hw_params apply failed");
        return false;
    }

    snd_pcm_hw_params_get_period_size(params.get(), &period, nullptr);
    snd_pcm_hw_params_get_buffer_size(params.get(), &buffer);
    periodSize_ = period;
    bufferSize_ = buffer;

    // Start as soon as one period is queued; short results never fill the buffer
    snd_pcm_sw_params_t* sw = nullptr;
    snd_pcm_sw_params_alloca(&sw);
    if (snd_pcm_sw_params_current(handle_, sw) < 0 ||
        snd_pcm_sw_params_set_start_threshold(handle_, sw, period) < 0 ||
        snd_pcm_sw_params(handle_, sw) < 0) {
        LOG_ERROR("[AlsaPlayback] failed to set start threshold");
        return false;
    }
    return true;
}

bool AlsaPlaybackSink::open(const std::string& pcmName, uint32_t sampleRate,
                            uint32_t periodFrames, uint32_t periods) {
    if (handle_) {
        close();
    }
    pcmName_ = pcmName;

    int rc = snd_pcm_open(&handle_, pcmName.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (rc < 0) {
        LOG_ERROR("[AlsaPlayback] failed to open device {}: {} (check available devices with "
                  "`aplay -L`)",
                  pcmName, snd_strerror(rc));
        handle_ = nullptr;
        return false;
    }

    if (!configureHardware(sampleRate, periodFrames, periods)) {
        close();
        return false;
    }
    sampleRate_ = sampleRate;

    LOG_INFO("[AlsaPlayback] opened {} rate={} channels=1 format=S16_LE period={} buffer={}",
             pcmName, sampleRate_, periodSize_, bufferSize_);
    return true;
}

bool AlsaPlaybackSink::recoverFromXrun() {
    int rc = snd_pcm_prepare(handle_);
    if (rc < 0) {
        LOG_ERROR("[AlsaPlayback] XRUN recover failed: {}", snd_strerror(rc));
        return false;
    }
    LOG_WARN("[AlsaPlayback] XRUN recovered with snd_pcm_prepare()");
    return true;
}

bool AlsaPlaybackSink::write(const int16_t* samples, size_t count) {
    if (!handle_) {
        LOG_ERROR("[AlsaPlayback] write called before open()");
        return false;
    }

    const int16_t* ptr = samples;
    size_t framesLeft = count;
    while (framesLeft > 0) {
        snd_pcm_sframes_t written = snd_pcm_writei(handle_, ptr, framesLeft);
        if (written == -EPIPE) {
            LOG_WARN("[AlsaPlayback] XRUN detected (EPIPE)");
            if (!recoverFromXrun()) {
                return false;
            }
            continue;
        }
        if (written == -EINTR) {
            continue;
        }
        if (written == -EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (written < 0) {
            LOG_ERROR("[AlsaPlayback] write failed: {}", snd_strerror(static_cast<int>(written)));
            return false;
        }
        framesLeft -= static_cast<size_t>(written);
        ptr += written;
    }
    return true;
}

size_t AlsaPlaybackSink::queuedFrames() {
    if (!handle_) {
        return 0;
    }
    // A tail shorter than the start threshold leaves the stream prepared
    if (snd_pcm_state(handle_) == SND_PCM_STATE_PREPARED) {
        const snd_pcm_sframes_t avail = snd_pcm_avail(handle_);
        if (avail >= 0 && static_cast<snd_pcm_uframes_t>(avail) < bufferSize_) {
            snd_pcm_start(handle_);
        }
    }
    snd_pcm_sframes_t delay = 0;
    if (snd_pcm_delay(handle_, &delay) < 0 || delay < 0) {
        // Underrun means everything queued has been rendered
        return 0;
    }
    return static_cast<size_t>(delay);
}

void AlsaPlaybackSink::drop() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_prepare(handle_);
    }
}

void AlsaPlaybackSink::close() {
    if (!handle_) {
        return;
    }
    snd_pcm_drop(handle_);
    snd_pcm_close(handle_);
    handle_ = nullptr;
    sampleRate_ = 0;
    periodSize_ = 0;
    bufferSize_ = 0;
    LOG_INFO("[AlsaPlayback] closed {}", pcmName_);
}

}  // namespace audio
}  // namespace voice_replacer
