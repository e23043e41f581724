#pragma once

#include "voice_replacer/audio/frame_queue.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voice_replacer {
namespace audio {

// Blocking PCM reader for one input device (mono S16)
class CaptureSource {
   public:
    virtual ~CaptureSource() = default;

    virtual bool open(const std::string& pcmName, uint32_t sampleRate, uint32_t blockFrames) = 0;
    /**
     * Read at most one block into `block`.
     * @return samples read, 0 when nothing arrived within one block period,
     *         negative on a device error
     */
    virtual int read(std::vector<int16_t>& block) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

/**
 * @brief Owns the input stream and feeds Frames into the frame queue.
 *
 * A dedicated capture thread reads blocks from the source and hands them to
 * deliverBlock(), which only wraps and enqueues (drop-oldest, never blocks on
 * downstream work).
 *
 * Every successful stream (re)open increments the capture epoch stamped on
 * each Frame; consumers use it to detect the discontinuity.
 */
class AudioCapture {
   public:
    struct Config {
        uint32_t sampleRate = 16000;
        uint32_t blockFrames = 480;
    };

    using ErrorHandler = std::function<void(const std::string& message)>;

    AudioCapture(std::unique_ptr<CaptureSource> source, FrameQueue& queue, Config config);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // @throws DeviceError when the device cannot be opened
    void start(const std::string& pcmName);
    void stop();

    /**
     * @brief Redirect capture to another device.
     *
     * On failure the previous device is reopened and DeviceError is thrown.
     */
    void switchDevice(const std::string& pcmName);

    // Wrap one block into a Frame and enqueue it. Called from the capture thread.
    void deliverBlock(const int16_t* samples, size_t count);

    // Invoked from the capture thread when reads keep failing
    void setErrorHandler(ErrorHandler handler);

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }
    uint64_t epoch() const {
        return epoch_.load(std::memory_order_acquire);
    }
    std::string currentDevice() const;
    const Config& config() const {
        return config_;
    }
    uint64_t blocksDelivered() const {
        return delivered_.load(std::memory_order_relaxed);
    }

   private:
    void openOrThrow(const std::string& pcmName);
    void startThread();
    void stopThread();
    void captureLoop();

    std::unique_ptr<CaptureSource> source_;
    FrameQueue& queue_;
    Config config_;

    mutable std::mutex deviceMutex_;  // Serializes start/stop/switch and guards device_
    std::string device_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> epoch_{0};
    std::atomic<uint64_t> delivered_{0};

    std::mutex handlerMutex_;
    ErrorHandler errorHandler_;
};

}  // namespace audio
}  // namespace voice_replacer
