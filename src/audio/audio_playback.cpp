#include "voice_replacer/audio/audio_playback.h"

#include "voice_replacer/core/errors.h"
#include "voice_replacer/logging/logger.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace voice_replacer {
namespace audio {

namespace {

// Rate used to validate a device selected while nothing has been played yet
constexpr uint32_t kProbeSampleRate = 22050;

}  // namespace

AudioPlayback::AudioPlayback(std::unique_ptr<PlaybackSink> sink, Config config)
    : sink_(std::move(sink)), config_(std::move(config)), device_(config_.device) {}

AudioPlayback::~AudioPlayback() {
    close();
}

void AudioPlayback::setErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    errorHandler_ = std::move(handler);
}

void AudioPlayback::reportError(const std::string& message) {
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = errorHandler_;
    }
    if (handler) {
        handler(message);
    }
}

std::string AudioPlayback::currentDevice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_;
}

void AudioPlayback::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_->isOpen()) {
        sink_->drop();
        sink_->close();
    }
}

void AudioPlayback::cancel() {
    if (playing_.load(std::memory_order_acquire)) {
        cancelRequested_.store(true, std::memory_order_release);
    }
}

void AudioPlayback::ensureOpen(uint32_t sampleRate) {
    if (sink_->isOpen() && sink_->sampleRate() == sampleRate) {
        return;
    }
    sink_->close();
    if (!sink_->open(device_, sampleRate, config_.periodFrames, config_.periods)) {
        throw DeviceError("cannot open output device '" + device_ + "' at " +
                              std::to_string(sampleRate) + " Hz",
                          ErrorCode::DEVICE_OPEN_FAILED);
    }
}

bool AudioPlayback::applySwitch(const std::string& pcmName, uint32_t sampleRate) {
    const std::string previous = device_;
    sink_->close();
    if (sink_->open(pcmName, sampleRate, config_.periodFrames, config_.periods)) {
        device_ = pcmName;
        LOG_INFO("[AudioPlayback] Output switched {} -> {}", previous, pcmName);
        return true;
    }

    LOG_ERROR("[AudioPlayback] Cannot open {}; keeping {}", pcmName, previous);
    reportError("cannot open output device '" + pcmName + "', keeping '" + previous + "'");
    return sink_->open(previous, sampleRate, config_.periodFrames, config_.periods);
}

std::optional<std::string> AudioPlayback::takePendingSwitch() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<std::string> pending;
    pending.swap(pending_);
    return pending;
}

void AudioPlayback::switchDevice(const std::string& pcmName) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (playing_.load(std::memory_order_acquire)) {
        pending_ = pcmName;
        LOG_DEBUG("[AudioPlayback] Switch to {} deferred ({} policy)", pcmName,
                  deviceSwitchPolicyToString(config_.switchPolicy));
        return;
    }
    if (pcmName == device_ && sink_->isOpen()) {
        return;
    }

    const uint32_t rate = sink_->isOpen() ? sink_->sampleRate() : kProbeSampleRate;
    const bool hadOpenSink = sink_->isOpen();
    const std::string previous = device_;
    sink_->close();
    if (!sink_->open(pcmName, rate, config_.periodFrames, config_.periods)) {
        if (hadOpenSink && !sink_->open(previous, rate, config_.periodFrames, config_.periods)) {
            LOG_ERROR("[AudioPlayback] Reopening {} failed as well", previous);
        }
        throw DeviceError("cannot open output device '" + pcmName + "'",
                          ErrorCode::DEVICE_OPEN_FAILED);
    }
    device_ = pcmName;
    LOG_INFO("[AudioPlayback] Output switched {} -> {}", previous, pcmName);
}

bool AudioPlayback::waitUntilRendered() {
    const uint32_t rate = std::max<uint32_t>(sink_->sampleRate(), 1);
    const auto period = std::chrono::microseconds(
        static_cast<int64_t>(config_.periodFrames) * 1000000 / rate);
    const auto step = std::min<std::chrono::microseconds>(period, std::chrono::milliseconds(10));

    while (sink_->queuedFrames() > 0) {
        if (cancelRequested_.load(std::memory_order_acquire)) {
            return false;
        }
        std::this_thread::sleep_for(step);
    }
    return true;
}

bool AudioPlayback::play(std::vector<AudioChunk> chunks,
                         const std::function<void()>& onFirstSample) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        playing_.store(true, std::memory_order_release);
        cancelRequested_.store(false, std::memory_order_release);
    }

    struct PlayingGuard {
        AudioPlayback* self;
        ~PlayingGuard() {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->playing_.store(false, std::memory_order_release);
            self->cancelRequested_.store(false, std::memory_order_release);
        }
    } guard{this};

    bool firstSampleReported = false;
    bool completed = true;

    for (auto& chunk : chunks) {
        if (chunk.samples.empty()) {
            continue;
        }
        if (auto pending = takePendingSwitch()) {
            if (!applySwitch(*pending, chunk.sampleRate)) {
                throw DeviceError("no usable output device", ErrorCode::DEVICE_OPEN_FAILED);
            }
        }
        ensureOpen(chunk.sampleRate);

        const size_t piece = config_.periodFrames;
        size_t offset = 0;
        while (offset < chunk.samples.size()) {
            if (cancelRequested_.load(std::memory_order_acquire)) {
                sink_->drop();
                completed = false;
                break;
            }
            if (config_.switchPolicy == DeviceSwitchPolicy::Discard) {
                if (auto pending = takePendingSwitch()) {
                    sink_->drop();
                    if (!applySwitch(*pending, chunk.sampleRate)) {
                        throw DeviceError("no usable output device",
                                          ErrorCode::DEVICE_OPEN_FAILED);
                    }
                    break;  // Rest of this chunk is discarded
                }
            }

            const size_t count = std::min(piece, chunk.samples.size() - offset);
            if (!sink_->write(chunk.samples.data() + offset, count)) {
                throw DeviceError("write to output device '" + device_ + "' failed",
                                  ErrorCode::DEVICE_IO_FAILED);
            }
            offset += count;

            if (!firstSampleReported) {
                firstSampleReported = true;
                if (onFirstSample) {
                    onFirstSample();
                }
            }
        }
        if (!completed) {
            break;
        }
        // Drain policy: a switch posted during this chunk lands here
        if (config_.switchPolicy == DeviceSwitchPolicy::Drain) {
            std::optional<std::string> pending;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (pending_) {
                    pending.swap(pending_);
                }
            }
            if (pending) {
                if (!waitUntilRendered()) {
                    sink_->drop();
                    completed = false;
                    break;
                }
                if (!applySwitch(*pending, chunk.sampleRate)) {
                    throw DeviceError("no usable output device", ErrorCode::DEVICE_OPEN_FAILED);
                }
            }
        }
    }

    if (completed && !waitUntilRendered()) {
        sink_->drop();
        completed = false;
    }

    if (completed) {
        resultsPlayed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        LOG_INFO("[AudioPlayback] Playback cancelled");
    }

    // Switch requested during a cancelled or finished result
    if (auto pending = takePendingSwitch()) {
        const uint32_t rate = sink_->isOpen() ? sink_->sampleRate() : kProbeSampleRate;
        if (!applySwitch(*pending, rate)) {
            LOG_ERROR("[AudioPlayback] No usable output device after switch to {}", *pending);
        }
    }
    return completed;
}

}  // namespace audio
}  // namespace voice_replacer
