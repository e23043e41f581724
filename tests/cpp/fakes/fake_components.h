#pragma once

// In-test replacements for the device, engine and stream seams. Each fake
// keeps its observable state in a shared State so tests can inspect it after
// the fake itself has been moved into the component under test.

#include "voice_replacer/asr/speech_recognizer.h"
#include "voice_replacer/audio/audio_capture.h"
#include "voice_replacer/audio/audio_playback.h"
#include "voice_replacer/audio/device_registry.h"
#include "voice_replacer/core/errors.h"
#include "voice_replacer/tts/speech_synthesizer.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace test_fakes {

using namespace voice_replacer;

// ========== Devices ==========

class FakeDeviceBackend : public audio::DeviceBackend {
   public:
    std::vector<audio::RawDevice> inputs;
    std::vector<audio::RawDevice> outputs;
    bool failEnumeration = false;

    std::vector<audio::RawDevice> enumerate(audio::Direction direction) override {
        if (failEnumeration) {
            throw DeviceError("enumeration failed", ErrorCode::DEVICE_ENUMERATION_FAILED);
        }
        return direction == audio::Direction::Input ? inputs : outputs;
    }
};

// Backend with a microphone, a speaker and a virtual cable
inline std::shared_ptr<FakeDeviceBackend> makeStandardBackend() {
    auto backend = std::make_shared<FakeDeviceBackend>();
    backend->inputs = {{"default", "Default Audio Device", true},
                       {"hw:USB,0", "USB Microphone", false}};
    backend->outputs = {{"default", "Default Audio Device", true},
                        {"hw:PCH,0", "HDA Intel PCH Speakers", false},
                        {"hw:Loopback,0,0", "Loopback PCM", false}};
    return backend;
}

// ========== Capture ==========

inline std::vector<int16_t> toneBlock(size_t frames, int16_t amplitude = 8000) {
    std::vector<int16_t> block(frames);
    for (size_t i = 0; i < frames; ++i) {
        block[i] = (i % 2 == 0) ? amplitude : static_cast<int16_t>(-amplitude);
    }
    return block;
}

inline std::vector<int16_t> silenceBlock(size_t frames) {
    return std::vector<int16_t>(frames, 0);
}

struct CaptureState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::vector<int16_t>> blocks;
    std::set<std::string> failingDevices;
    std::vector<std::string> opened;
    std::string device;
    bool open = false;
    int readError = 0;  // Returned by read() when non-zero

    void feed(std::vector<int16_t> block) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            blocks.push_back(std::move(block));
        }
        cv.notify_all();
    }
    void feedTone(size_t count, size_t frames = 480) {
        for (size_t i = 0; i < count; ++i) {
            feed(toneBlock(frames));
        }
    }
    void feedSilence(size_t count, size_t frames = 480) {
        for (size_t i = 0; i < count; ++i) {
            feed(silenceBlock(frames));
        }
    }
    size_t pending() {
        std::lock_guard<std::mutex> lock(mutex);
        return blocks.size();
    }
    std::vector<std::string> openedDevices() {
        std::lock_guard<std::mutex> lock(mutex);
        return opened;
    }
};

class FakeCaptureSource : public audio::CaptureSource {
   public:
    explicit FakeCaptureSource(std::shared_ptr<CaptureState> state) : state_(std::move(state)) {}

    bool open(const std::string& pcmName, uint32_t, uint32_t) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->failingDevices.count(pcmName) != 0) {
            return false;
        }
        state_->opened.push_back(pcmName);
        state_->device = pcmName;
        state_->open = true;
        return true;
    }

    int read(std::vector<int16_t>& block) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->readError != 0) {
            const int error = state_->readError;
            lock.unlock();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return error;
        }
        if (!state_->cv.wait_for(lock, std::chrono::milliseconds(5),
                                 [this] { return !state_->blocks.empty(); })) {
            return 0;
        }
        block = std::move(state_->blocks.front());
        state_->blocks.pop_front();
        return static_cast<int>(block.size());
    }

    void close() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->open = false;
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->open;
    }

   private:
    std::shared_ptr<CaptureState> state_;
};

// ========== Playback ==========

struct PlaybackState {
    mutable std::mutex mutex;
    std::vector<int16_t> written;
    std::vector<std::string> opened;
    std::set<std::string> failingDevices;
    std::string device;
    uint32_t rate = 0;
    bool open = false;
    bool failWrites = false;
    int drops = 0;
    std::chrono::milliseconds writeDelay{0};  // Simulated time to render one write
    std::atomic<int> writes{0};

    size_t samplesWritten() const {
        std::lock_guard<std::mutex> lock(mutex);
        return written.size();
    }
    std::string currentDevice() const {
        std::lock_guard<std::mutex> lock(mutex);
        return device;
    }
    std::vector<std::string> openedDevices() const {
        std::lock_guard<std::mutex> lock(mutex);
        return opened;
    }
};

class FakePlaybackSink : public audio::PlaybackSink {
   public:
    explicit FakePlaybackSink(std::shared_ptr<PlaybackState> state) : state_(std::move(state)) {}

    bool open(const std::string& pcmName, uint32_t sampleRate, uint32_t, uint32_t) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->failingDevices.count(pcmName) != 0) {
            return false;
        }
        state_->opened.push_back(pcmName);
        state_->device = pcmName;
        state_->rate = sampleRate;
        state_->open = true;
        return true;
    }

    bool write(const int16_t* samples, size_t count) override {
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->failWrites) {
                return false;
            }
            state_->written.insert(state_->written.end(), samples, samples + count);
            delay = state_->writeDelay;
        }
        state_->writes.fetch_add(1);
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return true;
    }

    size_t queuedFrames() override {
        return 0;
    }

    void drop() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->drops;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->open = false;
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->open;
    }

    uint32_t sampleRate() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->rate;
    }

   private:
    std::shared_ptr<PlaybackState> state_;
};

// ========== Recognition ==========

struct RecognizerState {
    std::mutex mutex;
    std::string finalText = "hello world";
    std::vector<std::string> partials;
    bool failLoad = false;
    bool failRecognition = false;
    bool faultInFinish = false;  // finish() throws a non-pipeline exception
    bool loaded = false;
    std::atomic<int> loads{0};
    std::atomic<int> sessions{0};  // finish() calls
    std::atomic<int> resets{0};
    std::atomic<size_t> samplesAccepted{0};
    std::chrono::milliseconds decodeDelay{0};
};

class FakeRecognitionEngine : public asr::RecognitionEngine {
   public:
    explicit FakeRecognitionEngine(std::shared_ptr<RecognizerState> state)
        : state_(std::move(state)) {}

    const char* name() const override {
        return "fake-asr";
    }

    void load(const std::string& modelPath, uint32_t) override {
        state_->loads.fetch_add(1);
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->failLoad) {
            throw ModelLoadError("model not found: " + modelPath, ErrorCode::MODEL_NOT_FOUND);
        }
        state_->loaded = true;
    }

    bool isLoaded() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->loaded;
    }

    std::optional<asr::RecognitionResult> accept(const int16_t*, size_t count) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->failRecognition) {
            throw RecognitionError("decoder fault");
        }
        const size_t before = state_->samplesAccepted.fetch_add(count);
        if (before == 0 && !state_->partials.empty()) {
            asr::RecognitionResult partial;
            partial.text = state_->partials.front();
            return partial;
        }
        return std::nullopt;
    }

    asr::RecognitionResult finish() override {
        std::chrono::milliseconds delay;
        asr::RecognitionResult result;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->failRecognition) {
                throw RecognitionError("decoder fault");
            }
            if (state_->faultInFinish) {
                throw std::logic_error("decoder invariant broken");
            }
            result.text = state_->finalText;
            result.confidence = 0.9f;
            delay = state_->decodeDelay;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        state_->sessions.fetch_add(1);
        return result;
    }

    void reset() override {
        state_->resets.fetch_add(1);
        state_->samplesAccepted = 0;
    }

   private:
    std::shared_ptr<RecognizerState> state_;
};

// ========== Synthesis ==========

struct SynthesizerState {
    std::mutex mutex;
    std::set<std::string> loadedVoices;
    std::set<std::string> brokenVoices;  // loadVoice() throws
    std::vector<std::string> texts;
    std::vector<std::string> voices;  // Voice of every synthesize() call
    std::string lastVoice;
    float lastSpeed = 0.0f;
    size_t samplesPerResult = 2205;  // 100 ms at 22050 Hz
    uint32_t sampleRate = 22050;
    bool failSynthesis = false;
    std::chrono::milliseconds synthDelay{0};
    std::atomic<int> calls{0};

    std::vector<std::string> spokenTexts() {
        std::lock_guard<std::mutex> lock(mutex);
        return texts;
    }
    std::vector<std::string> usedVoices() {
        std::lock_guard<std::mutex> lock(mutex);
        return voices;
    }
    float speed() {
        std::lock_guard<std::mutex> lock(mutex);
        return lastSpeed;
    }
};

class FakeSynthesisEngine : public tts::SynthesisEngine {
   public:
    explicit FakeSynthesisEngine(std::shared_ptr<SynthesizerState> state)
        : state_(std::move(state)) {}

    const char* name() const override {
        return "fake-tts";
    }

    void loadVoice(const tts::VoiceInfo& voice) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->brokenVoices.count(voice.id) != 0) {
            throw ModelLoadError("cannot load " + voice.id);
        }
        state_->loadedVoices.insert(voice.id);
    }

    bool hasVoice(const std::string& voiceId) const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->loadedVoices.count(voiceId) != 0;
    }

    tts::Waveform synthesize(const std::string& voiceId, const std::string& text,
                             float speed) override {
        state_->calls.fetch_add(1);
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            delay = state_->synthDelay;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->failSynthesis) {
            throw SynthesisError("synthesis fault");
        }
        state_->texts.push_back(text);
        state_->voices.push_back(voiceId);
        state_->lastVoice = voiceId;
        state_->lastSpeed = speed;
        tts::Waveform waveform;
        waveform.sampleRate = state_->sampleRate;
        waveform.samples = toneBlock(state_->samplesPerResult, 1000);
        return waveform;
    }

   private:
    std::shared_ptr<SynthesizerState> state_;
};

// ========== Helpers ==========

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

}  // namespace test_fakes
