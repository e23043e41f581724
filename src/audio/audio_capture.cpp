#include "voice_replacer/audio/audio_capture.h"

#include "voice_replacer/core/errors.h"
#include "voice_replacer/logging/logger.h"

#include <chrono>
#include <utility>

namespace voice_replacer {
namespace audio {

namespace {

// Consecutive failed reads before the error handler is told
constexpr int kReadErrorReportThreshold = 10;

}  // namespace

AudioCapture::AudioCapture(std::unique_ptr<CaptureSource> source, FrameQueue& queue,
                           Config config)
    : source_(std::move(source)), queue_(queue), config_(config) {}

AudioCapture::~AudioCapture() {
    stop();
}

void AudioCapture::setErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    errorHandler_ = std::move(handler);
}

std::string AudioCapture::currentDevice() const {
    std::lock_guard<std::mutex> lock(deviceMutex_);
    return device_;
}

void AudioCapture::openOrThrow(const std::string& pcmName) {
    if (!source_->open(pcmName, config_.sampleRate, config_.blockFrames)) {
        throw DeviceError("cannot open input device '" + pcmName + "'",
                          ErrorCode::DEVICE_OPEN_FAILED);
    }
    epoch_.fetch_add(1, std::memory_order_acq_rel);
}

void AudioCapture::start(const std::string& pcmName) {
    std::lock_guard<std::mutex> lock(deviceMutex_);
    if (running_.load(std::memory_order_acquire)) {
        LOG_DEBUG("[AudioCapture] start ignored, already capturing from {}", device_);
        return;
    }
    openOrThrow(pcmName);
    device_ = pcmName;
    startThread();
    LOG_INFO("[AudioCapture] Capturing from {} ({} Hz, {} frames/block)", pcmName,
             config_.sampleRate, config_.blockFrames);
}

void AudioCapture::stop() {
    std::lock_guard<std::mutex> lock(deviceMutex_);
    if (!running_.load(std::memory_order_acquire) && !thread_.joinable()) {
        return;
    }
    stopThread();
    source_->close();
    LOG_INFO("[AudioCapture] Stopped ({} blocks delivered)", blocksDelivered());
}

void AudioCapture::switchDevice(const std::string& pcmName) {
    std::lock_guard<std::mutex> lock(deviceMutex_);
    if (pcmName == device_ && running_.load(std::memory_order_acquire)) {
        return;
    }

    const bool wasRunning = running_.load(std::memory_order_acquire);
    stopThread();
    source_->close();

    try {
        openOrThrow(pcmName);
    } catch (const DeviceError& e) {
        LOG_ERROR("[AudioCapture] Switch to {} failed: {}; restoring {}", pcmName, e.what(),
                  device_);
        if (wasRunning && !device_.empty()) {
            try {
                openOrThrow(device_);
                startThread();
            } catch (const DeviceError& restoreError) {
                LOG_ERROR("[AudioCapture] Restoring {} failed: {}", device_, restoreError.what());
            }
        }
        throw;
    }

    LOG_INFO("[AudioCapture] Input switched {} -> {} (epoch {})", device_, pcmName, epoch());
    device_ = pcmName;
    if (wasRunning) {
        startThread();
    } else {
        source_->close();
    }
}

void AudioCapture::deliverBlock(const int16_t* samples, size_t count) {
    if (count == 0) {
        return;
    }
    Frame frame(std::vector<int16_t>(samples, samples + count), config_.sampleRate, Clock::now(),
                epoch());
    if (!queue_.push(std::move(frame))) {
        LOG_EVERY_N(WARN, 50, "[AudioCapture] Frame queue overflow, dropped {} frames so far",
                    queue_.droppedCount());
    }
    delivered_.fetch_add(1, std::memory_order_relaxed);
}

void AudioCapture::startThread() {
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&AudioCapture::captureLoop, this);
}

void AudioCapture::stopThread() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AudioCapture::captureLoop() {
    std::vector<int16_t> block(config_.blockFrames);
    int consecutiveErrors = 0;

    while (running_.load(std::memory_order_acquire)) {
        int n = source_->read(block);
        if (n > 0) {
            consecutiveErrors = 0;
            deliverBlock(block.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            continue;
        }

        ++consecutiveErrors;
        LOG_EVERY_N(WARN, 20, "[AudioCapture] Read error {} on {}", n, device_);
        if (consecutiveErrors == kReadErrorReportThreshold) {
            ErrorHandler handler;
            {
                std::lock_guard<std::mutex> lock(handlerMutex_);
                handler = errorHandler_;
            }
            if (handler) {
                handler("input device keeps failing (error " + std::to_string(n) + ")");
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

}  // namespace audio
}  // namespace voice_replacer
