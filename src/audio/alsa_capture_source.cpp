#include "voice_replacer/audio/alsa_capture_source.h"

#include "voice_replacer/logging/logger.h"

#include <memory>

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

AlsaCaptureSource::~AlsaCaptureSource() {
    close();
}

bool AlsaCaptureSource::open(const std::string& pcmName, uint32_t sampleRate,
                             uint32_t blockFrames) {
    close();
    pcmName_ = pcmName;

    int rc = snd_pcm_open(&handle_, pcmName.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (rc < 0) {
        LOG_ERROR("[AlsaCapture] snd_pcm_open({}) failed: {} (check devices with `arecord -L`)",
                  pcmName, snd_strerror(rc));
        handle_ = nullptr;
        return false;
    }

    auto fail = [&](const char* what, int err) {
        LOG_ERROR("[AlsaCapture] {} failed on {}: {}", what, pcmName, snd_strerror(err));
        close();
        return false;
    };

    std::unique_ptr<snd_pcm_hw_params_t, HwParamsDeleter> params;
    snd_pcm_hw_params_t* raw = nullptr;
    snd_pcm_hw_params_malloc(&raw);
    params.reset(raw);
    if (!params) {
        LOG_ERROR("[AlsaCapture] failed to alloc hw_params");
        close();
        return false;
    }

    if ((rc = snd_pcm_hw_params_any(handle_, params.get())) < 0) {
        return fail("hw_params_any", rc);
    }
    if ((rc = snd_pcm_hw_params_set_access(handle_, params.get(),
                                           SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail("set_access", rc);
    }
    if ((rc = snd_pcm_hw_params_set_format(handle_, params.get(), SND_PCM_FORMAT_S16_LE)) < 0) {
        return fail("set_format(S16_LE)", rc);
    }
    if ((rc = snd_pcm_hw_params_set_channels(handle_, params.get(), 1)) < 0) {
        return fail("set_channels(1)", rc);
    }
    // Let the plug layer resample when the hardware runs at another rate
    snd_pcm_hw_params_set_rate_resample(handle_, params.get(), 1);

    unsigned int rate = sampleRate;
    if ((rc = snd_pcm_hw_params_set_rate_near(handle_, params.get(), &rate, nullptr)) < 0) {
        return fail("set_rate_near", rc);
    }
    if (rate != sampleRate) {
        LOG_ERROR("[AlsaCapture] {} cannot capture at {} Hz (got {}); try a plughw: device",
                  pcmName, sampleRate, rate);
        close();
        return false;
    }

    snd_pcm_uframes_t period = blockFrames;
    if ((rc = snd_pcm_hw_params_set_period_size_near(handle_, params.get(), &period, nullptr)) <
        0) {
        return fail("set_period_size", rc);
    }
    snd_pcm_uframes_t buffer = period * 4;
    if ((rc = snd_pcm_hw_params_set_buffer_size_near(handle_, params.get(), &buffer)) < 0) {
        return fail("set_buffer_size", rc);
    }
    if ((rc = snd_pcm_hw_params(handle_, params.get())) < 0) {
        return fail("apply hw_params", rc);
    }
    if ((rc = snd_pcm_prepare(handle_)) < 0) {
        return fail("snd_pcm_prepare", rc);
    }
    if ((rc = snd_pcm_start(handle_)) < 0) {
        return fail("snd_pcm_start", rc);
    }

    sampleRate_ = sampleRate;
    blockFrames_ = blockFrames;
    // Two block periods, so a stalled device never pins the capture thread
    waitTimeoutMs_ = static_cast<int>(2 * 1000 * blockFrames / sampleRate) + 1;

    LOG_INFO("[AlsaCapture] opened device={} rate={} ch=1 fmt=S16_LE period_frames={} buffer={}",
             pcmName, rate, period, buffer);
    return true;
}

int AlsaCaptureSource::read(std::vector<int16_t>& block) {
    if (!handle_) {
        LOG_WARN("[AlsaCapture] read called before open");
        return -1;
    }
    if (block.size() < blockFrames_) {
        block.resize(blockFrames_);
    }

    int ready = snd_pcm_wait(handle_, waitTimeoutMs_);
    if (ready == 0) {
        return 0;
    }

    snd_pcm_sframes_t frames = snd_pcm_readi(handle_, block.data(), blockFrames_);
    if (frames == -EPIPE || ready == -EPIPE) {
        LOG_EVERY_N(WARN, 20, "[AlsaCapture] XRUN detected on {}, recovering", pcmName_);
        int rc = snd_pcm_prepare(handle_);
        if (rc < 0) {
            LOG_ERROR("[AlsaCapture] snd_pcm_prepare failed after XRUN: {}", snd_strerror(rc));
            return -1;
        }
        snd_pcm_start(handle_);
        return 0;
    }
    if (frames == -EAGAIN || frames == -EINTR) {
        return 0;
    }
    if (frames < 0) {
        int rc = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
        if (rc < 0) {
            LOG_EVERY_N(ERROR, 20, "[AlsaCapture] snd_pcm_readi failed: {}",
                        snd_strerror(static_cast<int>(frames)));
            return static_cast<int>(frames);
        }
        return 0;
    }
    return static_cast<int>(frames);
}

void AlsaCaptureSource::close() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
        LOG_INFO("[AlsaCapture] closed {}", pcmName_);
    }
}

}  // namespace audio
}  // namespace voice_replacer
