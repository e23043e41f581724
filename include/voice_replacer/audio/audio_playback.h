#pragma once

#include "voice_replacer/audio/frame.h"
#include "voice_replacer/core/config_loader.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voice_replacer {
namespace audio {

// Blocking PCM writer for one output device (mono S16)
class PlaybackSink {
   public:
    virtual ~PlaybackSink() = default;

    virtual bool open(const std::string& pcmName, uint32_t sampleRate, uint32_t periodFrames,
                      uint32_t periods) = 0;
    // Blocks until the samples are queued on the device; false on unrecoverable error
    virtual bool write(const int16_t* samples, size_t count) = 0;
    // Frames queued on the device and not yet rendered
    virtual size_t queuedFrames() = 0;
    // Discard queued audio immediately
    virtual void drop() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual uint32_t sampleRate() const = 0;
};

/**
 * @brief Renders one synthesis result at a time to the output device.
 *
 * play() runs on the synthesis+playback worker and writes period-sized pieces.
 * Between pieces it checks the cancel flag and any device switch posted from
 * another thread. The sink is (re)opened lazily at the chunk's sample rate.
 */
class AudioPlayback {
   public:
    struct Config {
        std::string device = "default";
        uint32_t periodFrames = 1024;
        uint32_t periods = 4;
        DeviceSwitchPolicy switchPolicy = DeviceSwitchPolicy::Drain;
    };

    using ErrorHandler = std::function<void(const std::string& message)>;

    AudioPlayback(std::unique_ptr<PlaybackSink> sink, Config config);
    ~AudioPlayback();

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    /**
     * @brief Play chunks in order. Blocks until rendered or cancelled.
     *
     * @param onFirstSample called once right after the first piece reached the device
     * @return true when everything was rendered, false when cancelled
     * @throws DeviceError when the device cannot be opened or written
     */
    bool play(std::vector<AudioChunk> chunks, const std::function<void()>& onFirstSample = {});

    // Halt the current play() within one period. No effect when idle.
    void cancel();

    /**
     * @brief Change the output device.
     *
     * Idle: applied immediately, throws DeviceError and keeps the previous
     * device when the new one cannot be opened.
     * Playing: applied by play() per the switch policy; a failure is reported
     * through the error handler and the previous device stays active.
     */
    void switchDevice(const std::string& pcmName);

    void setErrorHandler(ErrorHandler handler);

    // Release the device
    void close();

    bool isPlaying() const {
        return playing_.load(std::memory_order_acquire);
    }
    std::string currentDevice() const;
    uint64_t resultsPlayed() const {
        return resultsPlayed_.load(std::memory_order_relaxed);
    }

   private:
    void ensureOpen(uint32_t sampleRate);
    bool waitUntilRendered();
    // Returns false when neither the new nor the previous device could be opened
    bool applySwitch(const std::string& pcmName, uint32_t sampleRate);
    std::optional<std::string> takePendingSwitch();
    void reportError(const std::string& message);

    std::unique_ptr<PlaybackSink> sink_;
    Config config_;

    mutable std::mutex mutex_;  // Guards device_, pending_, and the sink while idle
    std::string device_;
    std::optional<std::string> pending_;

    std::atomic<bool> playing_{false};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<uint64_t> resultsPlayed_{0};

    std::mutex handlerMutex_;
    ErrorHandler errorHandler_;
};

}  // namespace audio
}  // namespace voice_replacer
