/**
 * @file pipeline_controller.h
 * @brief Voice replacement pipeline: state machine, workers and live reconfiguration
 *
 * Threads while running:
 * - capture thread (AudioCapture): only enqueues Frames
 * - segmentation worker: frames -> segmenter -> recognizer, device switches
 * - synthesis worker: final text -> synthesizer -> playback
 * - event dispatcher (EventChannel): status/text/error callbacks
 *
 * Exactly one utterance is in flight through recognition, synthesis and
 * playback. A completed utterance waits in a single pending slot meanwhile;
 * what happens to a further one depends on the barge-in policy.
 */

#pragma once

#include "voice_replacer/asr/speech_recognizer.h"
#include "voice_replacer/audio/audio_capture.h"
#include "voice_replacer/audio/audio_playback.h"
#include "voice_replacer/audio/device_registry.h"
#include "voice_replacer/audio/frame_queue.h"
#include "voice_replacer/core/config_loader.h"
#include "voice_replacer/core/error_codes.h"
#include "voice_replacer/pipeline/control_mailbox.h"
#include "voice_replacer/pipeline/event_channel.h"
#include "voice_replacer/pipeline/pipeline_state.h"
#include "voice_replacer/pipeline/pipeline_stats.h"
#include "voice_replacer/tts/speech_synthesizer.h"
#include "voice_replacer/vad/voice_activity_segmenter.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace voice_replacer {

namespace ui {
class Presenter;
}  // namespace ui

namespace pipeline {

// Backends the controller is assembled from. Tests pass fakes.
struct PipelineComponents {
    std::shared_ptr<audio::DeviceBackend> deviceBackend;
    std::unique_ptr<audio::CaptureSource> captureSource;
    std::unique_ptr<audio::PlaybackSink> playbackSink;
    std::unique_ptr<asr::RecognitionEngine> recognitionEngine;
    std::unique_ptr<tts::SynthesisEngine> synthesisEngine;
};

// ALSA devices, Vosk recognizer and Piper synthesizer
PipelineComponents createDefaultComponents(const AppConfig& config);

// Live selections, as applied by the workers
struct PipelineSelection {
    std::optional<int> inputDevice;
    std::optional<int> outputDevice;
    std::string voice;
    float speed = 1.0f;
};

class PipelineController {
   public:
    using ProgressCallback = std::function<void(const std::string& component, float fraction)>;
    using StatusCallback = std::function<void(const PipelineStatus&)>;
    using TextCallback = std::function<void(const std::string&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    PipelineController(AppConfig config, PipelineComponents components);
    ~PipelineController();

    PipelineController(const PipelineController&) = delete;
    PipelineController& operator=(const PipelineController&) = delete;

    /**
     * @brief Load the recognizer, then the synthesizer voice.
     *
     * Reports progress per component. Safe to call again after a failure;
     * returns true immediately once it has succeeded.
     */
    bool initialize(const ProgressCallback& progress = {});
    bool isInitialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    // Idle -> Listening. False when not initialized, already running, or a device fails.
    bool start();
    // Any state -> Idle. No callback fires after this returns.
    void stop();
    // Leave Error (same as stop)
    void reset();

    bool isRunning() const;
    PipelineState state() const;
    PipelineStatus status() const;
    PipelineStatsSnapshot stats() const;
    PipelineSelection selection() const;

    void setStatusCallback(StatusCallback callback);
    void setTextCallback(TextCallback callback);
    void setErrorCallback(ErrorCallback callback);
    // Route all three callbacks to a presenter
    void attachPresenter(std::shared_ptr<ui::Presenter> presenter);

    // Live setters. False only for requests that can never succeed
    // (unknown index or voice, speed out of range); device open failures are
    // reported through the error callback.
    bool setInputDevice(std::optional<int> index);
    bool setOutputDevice(std::optional<int> index);
    bool setVoice(const std::string& voiceId);
    bool setSpeed(float speed);

    std::vector<audio::DeviceInfo> listInputDevices() const;
    std::vector<audio::DeviceInfo> listOutputDevices() const;
    std::optional<audio::DeviceInfo> findVirtualCable() const;
    std::map<std::string, tts::VoiceInfo> listVoices() const;

    // Loaded configuration with the live selections folded in
    AppConfig currentConfig() const;

   private:
    struct SynthesisJob {
        std::string text;
        audio::Clock::time_point utteranceEnd;
    };

    // State machine
    void setState(PipelineState next);
    void enterError(const std::string& message);
    void recordError(ErrorCode code, const std::string& message);
    void postStatus();
    void dispatch(const PipelineEvent& event);

    // Segmentation worker
    void segmentationLoop();
    void handleFrame(audio::Frame frame);
    void onUtteranceStarted();
    void onUtteranceEnded(audio::Utterance utterance);
    void dispatchPending();
    void recognize(audio::Utterance utterance);
    void applyDeviceChanges();
    void refreshFrameStats();

    // Synthesis worker
    void synthesisLoop();
    void speak(SynthesisJob job);
    void applyVoiceChanges();
    void finishInFlight();

    std::string resolveOutputDevice(std::optional<int> index) const;

    AppConfig config_;
    audio::DeviceRegistry registry_;
    audio::FrameQueue frameQueue_;
    std::unique_ptr<audio::AudioCapture> capture_;
    std::unique_ptr<audio::AudioPlayback> playback_;
    std::unique_ptr<asr::SpeechRecognizer> recognizer_;
    std::unique_ptr<tts::SpeechSynthesizer> synthesizer_;
    vad::VoiceActivitySegmenter segmenter_;  // Segmentation worker only
    uint64_t segmenterEpoch_ = 0;            // Segmentation worker only

    ControlMailbox mailbox_;
    EventChannel events_;
    PipelineStats stats_;

    std::mutex lifecycleMutex_;  // Serializes initialize/start/stop
    std::atomic<bool> initialized_{false};
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> synthesisActive_{false};

    mutable std::mutex stateMutex_;
    PipelineState state_ = PipelineState::Idle;
    double latencyMs_ = 0.0;
    std::string lastError_;

    mutable std::mutex selectionMutex_;
    PipelineSelection selection_;

    // Utterance handoff (single in-flight token plus one pending slot)
    std::mutex handoffMutex_;
    std::condition_variable handoffCv_;
    bool inFlight_ = false;
    std::optional<audio::Utterance> pending_;

    // Final text to the synthesis worker
    std::mutex synthMutex_;
    std::condition_variable synthCv_;
    std::optional<SynthesisJob> synthJob_;
    std::string activeVoice_;  // Synthesis worker only
    float activeSpeed_ = 1.0f;  // Synthesis worker only

    std::mutex callbackMutex_;
    StatusCallback statusCallback_;
    TextCallback textCallback_;
    ErrorCallback errorCallback_;

    std::thread segmentationThread_;
    std::thread synthesisThread_;
    audio::Clock::time_point lastStatusPost_{};
};

}  // namespace pipeline
}  // namespace voice_replacer
