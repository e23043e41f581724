#include "voice_replacer/pipeline/pipeline_controller.h"

#include "voice_replacer/core/errors.h"
#include "voice_replacer/logging/logger.h"
#include "voice_replacer/ui/presenter.h"

#include <chrono>
#include <utility>

namespace voice_replacer {
namespace pipeline {

namespace {

constexpr auto kFramePopTimeout = std::chrono::milliseconds(50);
constexpr auto kHandoffPollInterval = std::chrono::milliseconds(50);
constexpr auto kSynthesisWaitTimeout = std::chrono::milliseconds(100);
constexpr auto kStopPollInterval = std::chrono::milliseconds(5);

std::optional<int> toSelection(int index) {
    if (index < 0) {
        return std::nullopt;
    }
    return index;
}

int fromSelection(const std::optional<int>& index) {
    return index ? *index : -1;
}

std::string formatError(ErrorCode code, const std::string& message) {
    return std::string(errorCodeToString(code)) + ": " + message;
}

std::string describeSelection(const std::optional<int>& index) {
    return index ? std::to_string(*index) : std::string("default");
}

vad::SegmenterConfig toSegmenterConfig(const AppConfig::VadConfig& vad) {
    vad::SegmenterConfig config;
    config.threshold = vad.threshold;
    config.smoothing = vad.smoothing;
    config.onsetFrames = vad.onsetFrames;
    config.hangoverFrames = vad.hangoverFrames;
    config.maxUtteranceMs = vad.maxUtteranceMs;
    return config;
}

audio::AudioPlayback::Config toPlaybackConfig(const AppConfig::AudioConfig& audioConfig) {
    audio::AudioPlayback::Config config;
    config.device = audio::kDefaultPcmName;
    config.periodFrames = audioConfig.playbackPeriodFrames;
    config.periods = audioConfig.playbackPeriods;
    config.switchPolicy = audioConfig.switchPolicy;
    return config;
}

}  // namespace

PipelineController::PipelineController(AppConfig config, PipelineComponents components)
    : config_(std::move(config)),
      registry_(std::move(components.deviceBackend)),
      frameQueue_(config_.audio.frameQueueCapacity),
      segmenter_(toSegmenterConfig(config_.vad)) {
    audio::AudioCapture::Config captureConfig;
    captureConfig.sampleRate = config_.audio.sampleRate;
    captureConfig.blockFrames = config_.audio.blockFrames;
    capture_ = std::make_unique<audio::AudioCapture>(std::move(components.captureSource),
                                                     frameQueue_, captureConfig);
    playback_ = std::make_unique<audio::AudioPlayback>(std::move(components.playbackSink),
                                                       toPlaybackConfig(config_.audio));
    recognizer_ = std::make_unique<asr::SpeechRecognizer>(
        std::move(components.recognitionEngine), config_.recognizer.modelPath,
        config_.audio.sampleRate);
    synthesizer_ = std::make_unique<tts::SpeechSynthesizer>(
        std::move(components.synthesisEngine), tts::VoiceCatalog(config_.synthesizer.voicesDir));

    selection_.inputDevice = toSelection(config_.audio.inputDevice);
    selection_.outputDevice = toSelection(config_.audio.outputDevice);
    selection_.voice = config_.synthesizer.voice;
    selection_.speed = config_.synthesizer.speed;

    capture_->setErrorHandler([this](const std::string& message) {
        recordError(ErrorCode::DEVICE_IO_FAILED, message);
    });
    playback_->setErrorHandler([this](const std::string& message) {
        recordError(ErrorCode::DEVICE_OPEN_FAILED, message);
    });
}

PipelineController::~PipelineController() {
    stop();
}

// ========== Lifecycle ==========

bool PipelineController::initialize(const ProgressCallback& progress) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (initialized_.load(std::memory_order_acquire)) {
        return true;
    }

    auto report = [&progress](const std::string& component, float fraction) {
        if (progress) {
            progress(component, fraction);
        }
    };

    try {
        report("recognizer", 0.0f);
        if (!recognizer_->isReady()) {
            LOG_INFO("[Pipeline] Loading recognizer ({}) from {}", recognizer_->engineName(),
                     recognizer_->modelPath());
            recognizer_->initialize();
        }
        report("recognizer", 1.0f);

        std::string voice;
        {
            std::lock_guard<std::mutex> selectionLock(selectionMutex_);
            voice = selection_.voice;
        }
        LOG_INFO("[Pipeline] Loading voice {}", voice);
        report("synthesizer", 0.0f);
        synthesizer_->initialize(
            voice, [&report](float fraction) { report("synthesizer", fraction); });
        report("synthesizer", 1.0f);
    } catch (const VoiceReplacerError& e) {
        LOG_ERROR("[Pipeline] Initialization failed: {} ({})", e.what(),
                  errorCodeToString(e.code()));
        recordError(e.code(), e.what());
        return false;
    }

    initialized_.store(true, std::memory_order_release);
    LOG_INFO("[Pipeline] Initialized");
    return true;
}

bool PipelineController::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!initialized_.load(std::memory_order_acquire)) {
        LOG_WARN("[Pipeline] start() before a successful initialize()");
        return false;
    }
    if (state() != PipelineState::Idle) {
        LOG_DEBUG("[Pipeline] start() ignored, already running");
        return false;
    }

    stopRequested_.store(false, std::memory_order_release);
    frameQueue_.clear();
    frameQueue_.reopen();
    segmenter_.abandon();
    segmenterEpoch_ = 0;
    {
        std::lock_guard<std::mutex> handoffLock(handoffMutex_);
        inFlight_ = false;
        pending_.reset();
    }
    {
        std::lock_guard<std::mutex> synthLock(synthMutex_);
        synthJob_.reset();
    }

    // Setter messages posted while idle are folded into the selection used below
    mailbox_.takeDeviceChanges();
    mailbox_.takeVoiceChanges();
    PipelineSelection current = selection();
    activeVoice_ = current.voice;
    activeSpeed_ = current.speed;

    std::string inputPcm;
    std::string outputPcm;
    try {
        inputPcm = registry_.resolveInput(current.inputDevice);
        outputPcm = resolveOutputDevice(current.outputDevice);
        playback_->switchDevice(outputPcm);
    } catch (const DeviceError& e) {
        LOG_ERROR("[Pipeline] Output device unavailable: {}", e.what());
        recordError(e.code(), e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        latencyMs_ = 0.0;
        lastError_.clear();
    }
    events_.start([this](const PipelineEvent& event) { dispatch(event); });

    try {
        capture_->start(inputPcm);
    } catch (const DeviceError& e) {
        LOG_ERROR("[Pipeline] Input device unavailable: {}", e.what());
        events_.stop();
        playback_->close();
        {
            std::lock_guard<std::mutex> stateLock(stateMutex_);
            lastError_ = formatError(e.code(), e.what());
        }
        return false;
    }

    lastStatusPost_ = audio::Clock::now();
    setState(PipelineState::Listening);
    segmentationThread_ = std::thread(&PipelineController::segmentationLoop, this);
    synthesisActive_.store(true, std::memory_order_release);
    synthesisThread_ = std::thread(&PipelineController::synthesisLoop, this);

    LOG_INFO("[Pipeline] Started: input={} output={} voice={} speed={:.2f} barge-in={}",
             inputPcm, outputPcm, current.voice, current.speed,
             bargeInPolicyToString(config_.pipeline.bargeIn));
    return true;
}

void PipelineController::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (state() == PipelineState::Idle && !segmentationThread_.joinable() &&
        !synthesisThread_.joinable()) {
        return;
    }

    LOG_INFO("[Pipeline] Stopping");
    stopRequested_.store(true, std::memory_order_release);
    playback_->cancel();
    handoffCv_.notify_all();
    synthCv_.notify_all();

    capture_->stop();
    frameQueue_.close();

    if (segmentationThread_.joinable()) {
        segmentationThread_.join();
    }
    // A response may start playing after any single cancel; repeat until the worker is out
    while (synthesisActive_.load(std::memory_order_acquire)) {
        playback_->cancel();
        synthCv_.notify_all();
        std::this_thread::sleep_for(kStopPollInterval);
    }
    if (synthesisThread_.joinable()) {
        synthesisThread_.join();
    }

    {
        std::lock_guard<std::mutex> handoffLock(handoffMutex_);
        inFlight_ = false;
        pending_.reset();
    }
    {
        std::lock_guard<std::mutex> synthLock(synthMutex_);
        synthJob_.reset();
    }
    segmenter_.abandon();
    playback_->close();
    refreshFrameStats();

    {
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        state_ = PipelineState::Idle;
    }
    // Last: undelivered events are discarded and no callback runs after this
    events_.stop();
    LOG_INFO("[Pipeline] Stopped");
}

void PipelineController::reset() {
    stop();
}

bool PipelineController::isRunning() const {
    return state() != PipelineState::Idle;
}

PipelineState PipelineController::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

PipelineStatus PipelineController::status() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return makeStatus(state_, latencyMs_, frameQueue_.droppedCount(), lastError_);
}

PipelineStatsSnapshot PipelineController::stats() const {
    PipelineStatsSnapshot snapshot = stats_.snapshot();
    snapshot.framesCaptured = frameQueue_.pushedCount();
    snapshot.framesDropped = frameQueue_.droppedCount();
    return snapshot;
}

PipelineSelection PipelineController::selection() const {
    std::lock_guard<std::mutex> lock(selectionMutex_);
    return selection_;
}

// ========== Callbacks ==========

void PipelineController::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    statusCallback_ = std::move(callback);
}

void PipelineController::setTextCallback(TextCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    textCallback_ = std::move(callback);
}

void PipelineController::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    errorCallback_ = std::move(callback);
}

void PipelineController::attachPresenter(std::shared_ptr<ui::Presenter> presenter) {
    if (!presenter) {
        return;
    }
    setStatusCallback(
        [presenter](const PipelineStatus& status) { presenter->renderStatus(status); });
    setTextCallback([presenter](const std::string& text) { presenter->renderText(text); });
    setErrorCallback(
        [presenter](const std::string& message) { presenter->promptError(message); });
}

void PipelineController::dispatch(const PipelineEvent& event) {
    // Runs on the event dispatcher thread
    if (auto* status = std::get_if<StatusEvent>(&event)) {
        StatusCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = statusCallback_;
        }
        if (callback) {
            callback(status->status);
        }
    } else if (auto* text = std::get_if<TextEvent>(&event)) {
        TextCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = textCallback_;
        }
        if (callback) {
            callback(text->text);
        }
    } else if (auto* error = std::get_if<ErrorEvent>(&event)) {
        ErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = errorCallback_;
        }
        if (callback) {
            callback(error->message);
        }
    }
}

// ========== State machine ==========

void PipelineController::setState(PipelineState next) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == next) {
            return;
        }
        // Workers keep running briefly after stop()/fault; their transitions no longer count
        if (stopRequested_.load(std::memory_order_acquire) || state_ == PipelineState::Error) {
            return;
        }
        if (!isValidTransition(state_, next)) {
            LOG_WARN("[Pipeline] Ignoring transition {} -> {}", pipelineStateToString(state_),
                     pipelineStateToString(next));
            return;
        }
        LOG_DEBUG("[Pipeline] {} -> {}", pipelineStateToString(state_),
                  pipelineStateToString(next));
        state_ = next;
    }
    postStatus();
}

void PipelineController::postStatus() {
    events_.post(StatusEvent{status()});
}

void PipelineController::recordError(ErrorCode code, const std::string& message) {
    const std::string formatted = formatError(code, message);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        lastError_ = formatted;
    }
    events_.post(ErrorEvent{formatted});
    postStatus();
}

void PipelineController::enterError(const std::string& message) {
    const std::string formatted = formatError(ErrorCode::INTERNAL_WORKER_FAULT, message);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == PipelineState::Error || stopRequested_.load(std::memory_order_acquire)) {
            return;
        }
        state_ = PipelineState::Error;
        lastError_ = formatted;
    }
    playback_->cancel();
    handoffCv_.notify_all();
    synthCv_.notify_all();
    events_.post(StatusEvent{status()});
    events_.post(ErrorEvent{formatted});
}

// ========== Live setters ==========

bool PipelineController::setInputDevice(std::optional<int> index) {
    if (index) {
        auto devices = registry_.listInputDevices();
        if (*index < 0 || static_cast<size_t>(*index) >= devices.size()) {
            LOG_WARN("[Pipeline] Unknown input device index {}", *index);
            return false;
        }
    }
    {
        std::lock_guard<std::mutex> lock(selectionMutex_);
        selection_.inputDevice = index;
    }
    mailbox_.postInputDevice(index);
    LOG_INFO("[Pipeline] Input device -> {}", describeSelection(index));
    return true;
}

bool PipelineController::setOutputDevice(std::optional<int> index) {
    if (index) {
        auto devices = registry_.listOutputDevices();
        if (*index < 0 || static_cast<size_t>(*index) >= devices.size()) {
            LOG_WARN("[Pipeline] Unknown output device index {}", *index);
            return false;
        }
    }
    {
        std::lock_guard<std::mutex> lock(selectionMutex_);
        selection_.outputDevice = index;
    }
    mailbox_.postOutputDevice(index);
    LOG_INFO("[Pipeline] Output device -> {}", describeSelection(index));
    return true;
}

bool PipelineController::setVoice(const std::string& voiceId) {
    if (!synthesizer_->catalog().find(voiceId)) {
        LOG_WARN("[Pipeline] Unknown voice {}", voiceId);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(selectionMutex_);
        selection_.voice = voiceId;
    }
    mailbox_.postVoice(voiceId);
    LOG_INFO("[Pipeline] Voice -> {} (from next response)", voiceId);
    return true;
}

bool PipelineController::setSpeed(float speed) {
    if (!tts::SynthesisRequest::isValidSpeed(speed)) {
        LOG_WARN("[Pipeline] Speed {:.2f} outside [{:.1f}, {:.1f}]", speed, kMinSpeed, kMaxSpeed);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(selectionMutex_);
        selection_.speed = speed;
    }
    mailbox_.postSpeed(speed);
    LOG_INFO("[Pipeline] Speed -> {:.2f} (from next response)", speed);
    return true;
}

std::vector<audio::DeviceInfo> PipelineController::listInputDevices() const {
    return registry_.listInputDevices();
}

std::vector<audio::DeviceInfo> PipelineController::listOutputDevices() const {
    return registry_.listOutputDevices();
}

std::optional<audio::DeviceInfo> PipelineController::findVirtualCable() const {
    return registry_.findVirtualCable();
}

std::map<std::string, tts::VoiceInfo> PipelineController::listVoices() const {
    return synthesizer_->listVoices();
}

AppConfig PipelineController::currentConfig() const {
    AppConfig config = config_;
    PipelineSelection current = selection();
    config.audio.inputDevice = fromSelection(current.inputDevice);
    config.audio.outputDevice = fromSelection(current.outputDevice);
    config.synthesizer.voice = current.voice;
    config.synthesizer.speed = current.speed;
    return config;
}

std::string PipelineController::resolveOutputDevice(std::optional<int> index) const {
    if (!index && config_.audio.preferVirtualCable) {
        if (auto cable = registry_.findVirtualCable()) {
            LOG_INFO("[Pipeline] Using virtual cable {} ({})", cable->name, cable->pcmName);
            return cable->pcmName;
        }
        LOG_WARN("[Pipeline] No virtual cable found, playing to the default output");
    }
    return registry_.resolveOutput(index);
}

// ========== Segmentation worker ==========

void PipelineController::segmentationLoop() {
    LOG_DEBUG("[Pipeline] Segmentation worker started");
    try {
        while (!stopRequested_.load(std::memory_order_acquire) &&
               state() != PipelineState::Error) {
            applyDeviceChanges();
            dispatchPending();
            refreshFrameStats();

            auto frame = frameQueue_.pop(kFramePopTimeout);
            if (!frame) {
                continue;
            }
            handleFrame(std::move(*frame));
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL("[Pipeline] Segmentation worker failed: {}", e.what());
        enterError(e.what());
    } catch (...) {
        LOG_CRITICAL("[Pipeline] Segmentation worker failed with an unknown exception");
        enterError("unknown exception in segmentation worker");
    }
    LOG_DEBUG("[Pipeline] Segmentation worker exiting");
}

void PipelineController::handleFrame(audio::Frame frame) {
    // Frames of a stream that was replaced by a device switch
    if (frame.epoch < capture_->epoch()) {
        return;
    }
    if (frame.epoch != segmenterEpoch_) {
        if (segmenterEpoch_ != 0 && segmenter_.inUtterance()) {
            LOG_INFO("[Pipeline] Input stream changed, abandoning the utterance in progress");
            stats_.incrementAbandoned();
        }
        segmenter_.abandon();
        segmenterEpoch_ = frame.epoch;
    }

    auto event = segmenter_.process(std::move(frame));
    if (!event) {
        return;
    }
    if (event->type == vad::SegmenterEventType::UtteranceStarted) {
        onUtteranceStarted();
    } else {
        onUtteranceEnded(std::move(event->utterance));
    }
}

void PipelineController::onUtteranceStarted() {
    LOG_DEBUG("[Pipeline] Speech started");
    if (config_.pipeline.bargeIn == BargeInPolicy::Interrupt &&
        state() == PipelineState::Speaking) {
        LOG_INFO("[Pipeline] New speech, interrupting the current response");
        playback_->cancel();
    }
}

void PipelineController::onUtteranceEnded(audio::Utterance utterance) {
    stats_.incrementUtterances();
    LOG_DEBUG("[Pipeline] Utterance ended: {} ms{}",
              std::chrono::duration_cast<std::chrono::milliseconds>(utterance.duration).count(),
              utterance.forcedClose ? " (max duration)" : "");

    std::unique_lock<std::mutex> lock(handoffMutex_);
    if (!inFlight_ && !pending_) {
        inFlight_ = true;
        lock.unlock();
        recognize(std::move(utterance));
        return;
    }
    if (!pending_) {
        pending_ = std::move(utterance);
        return;
    }
    if (config_.pipeline.bargeIn == BargeInPolicy::Drop) {
        LOG_INFO("[Pipeline] Pending slot occupied, dropping utterance");
        stats_.incrementDropped();
        return;
    }

    // Queue/Interrupt: hold segmentation until the in-flight utterance is done
    while (inFlight_ && !stopRequested_.load(std::memory_order_acquire)) {
        handoffCv_.wait_for(lock, kHandoffPollInterval);
        if (inFlight_) {
            lock.unlock();
            applyDeviceChanges();
            lock.lock();
        }
        if (state() == PipelineState::Error) {
            return;
        }
    }
    if (stopRequested_.load(std::memory_order_acquire)) {
        return;
    }
    audio::Utterance next = std::move(*pending_);
    pending_ = std::move(utterance);
    inFlight_ = true;
    lock.unlock();
    recognize(std::move(next));
}

void PipelineController::dispatchPending() {
    std::unique_lock<std::mutex> lock(handoffMutex_);
    if (inFlight_ || !pending_) {
        return;
    }
    audio::Utterance next = std::move(*pending_);
    pending_.reset();
    inFlight_ = true;
    lock.unlock();
    recognize(std::move(next));
}

void PipelineController::recognize(audio::Utterance utterance) {
    const audio::Clock::time_point utteranceEnd = utterance.end;
    setState(PipelineState::Recognizing);

    std::string text;
    try {
        auto results = recognizer_->recognize(std::move(utterance));
        text = asr::SpeechRecognizer::finalText(results);
    } catch (const VoiceReplacerError& e) {
        LOG_ERROR("[Pipeline] Recognition failed: {}", e.what());
        stats_.incrementRecognitionFailures();
        recordError(e.code(), e.what());
        setState(PipelineState::Listening);
        finishInFlight();
        return;
    }

    if (text.empty()) {
        LOG_DEBUG("[Pipeline] Nothing recognized");
        stats_.incrementEmptyRecognitions();
        setState(PipelineState::Listening);
        finishInFlight();
        return;
    }

    LOG_INFO("[Pipeline] Recognized: \"{}\"", text);
    events_.post(TextEvent{text});
    setState(PipelineState::Synthesizing);
    {
        std::lock_guard<std::mutex> lock(synthMutex_);
        synthJob_ = SynthesisJob{std::move(text), utteranceEnd};
    }
    synthCv_.notify_one();
}

void PipelineController::applyDeviceChanges() {
    DeviceChanges changes = mailbox_.takeDeviceChanges();
    if (changes.empty()) {
        return;
    }

    if (changes.input) {
        try {
            const std::string pcm = registry_.resolveInput(changes.input->index);
            capture_->switchDevice(pcm);
            // Frames already queued belong to the old stream
            frameQueue_.clear();
        } catch (const DeviceError& e) {
            LOG_ERROR("[Pipeline] Input switch failed: {}", e.what());
            recordError(e.code(), e.what());
        }
    }

    if (changes.output) {
        try {
            playback_->switchDevice(resolveOutputDevice(changes.output->index));
        } catch (const DeviceError& e) {
            LOG_ERROR("[Pipeline] Output switch failed: {}", e.what());
            recordError(e.code(), e.what());
        }
    }
    postStatus();
}

void PipelineController::refreshFrameStats() {
    const uint64_t dropped = frameQueue_.droppedCount();
    stats_.setFrames(frameQueue_.pushedCount(), dropped);

    const auto now = audio::Clock::now();
    if (now - lastStatusPost_ < std::chrono::milliseconds(config_.pipeline.statusIntervalMs)) {
        return;
    }
    lastStatusPost_ = now;
    if (dropped > 0 && !stopRequested_.load(std::memory_order_acquire)) {
        postStatus();
    }
}

// ========== Synthesis worker ==========

void PipelineController::synthesisLoop() {
    LOG_DEBUG("[Pipeline] Synthesis worker started");
    try {
        while (true) {
            std::optional<SynthesisJob> job;
            {
                std::unique_lock<std::mutex> lock(synthMutex_);
                synthCv_.wait_for(lock, kSynthesisWaitTimeout, [this] {
                    return synthJob_.has_value() || stopRequested_.load(std::memory_order_acquire);
                });
                if (stopRequested_.load(std::memory_order_acquire) ||
                    state() == PipelineState::Error) {
                    break;
                }
                if (!synthJob_) {
                    continue;
                }
                job.swap(synthJob_);
            }
            speak(std::move(*job));
            finishInFlight();
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL("[Pipeline] Synthesis worker failed: {}", e.what());
        enterError(e.what());
        finishInFlight();
    } catch (...) {
        LOG_CRITICAL("[Pipeline] Synthesis worker failed with an unknown exception");
        enterError("unknown exception in synthesis worker");
        finishInFlight();
    }
    synthesisActive_.store(false, std::memory_order_release);
    LOG_DEBUG("[Pipeline] Synthesis worker exiting");
}

void PipelineController::applyVoiceChanges() {
    VoiceChanges changes = mailbox_.takeVoiceChanges();
    if (changes.voice && *changes.voice != activeVoice_) {
        LOG_INFO("[Pipeline] Voice {} -> {}", activeVoice_, *changes.voice);
        activeVoice_ = std::move(*changes.voice);
    }
    if (changes.speed) {
        activeSpeed_ = *changes.speed;
    }
}

void PipelineController::speak(SynthesisJob job) {
    // Voice and speed only change between responses
    applyVoiceChanges();

    tts::Waveform waveform;
    try {
        tts::SynthesisRequest request(job.text, activeVoice_, activeSpeed_);
        waveform = synthesizer_->synthesize(request);
    } catch (const VoiceReplacerError& e) {
        LOG_ERROR("[Pipeline] Synthesis failed: {}", e.what());
        stats_.incrementSynthesisFailures();
        recordError(e.code(), e.what());
        setState(PipelineState::Listening);
        return;
    }

    if (waveform.empty() || stopRequested_.load(std::memory_order_acquire)) {
        setState(PipelineState::Listening);
        return;
    }

    setState(PipelineState::Speaking);
    auto onFirstSample = [this, &job] {
        const double latency =
            std::chrono::duration<double, std::milli>(audio::Clock::now() - job.utteranceEnd)
                .count();
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            latencyMs_ = latency < 0.0 ? 0.0 : latency;
        }
        stats_.setLastLatency(latency);
        LOG_DEBUG("[Pipeline] First sample after {:.0f} ms", latency);
        postStatus();
    };

    try {
        const bool completed =
            playback_->play(waveform.toChunks(config_.audio.playbackPeriodFrames), onFirstSample);
        stats_.recordSpoken(completed);
        if (!completed) {
            LOG_INFO("[Pipeline] Response interrupted");
        }
    } catch (const DeviceError& e) {
        LOG_ERROR("[Pipeline] Playback failed: {}", e.what());
        stats_.incrementPlaybackFailures();
        recordError(e.code(), e.what());
    }
    setState(PipelineState::Listening);
}

void PipelineController::finishInFlight() {
    {
        std::lock_guard<std::mutex> lock(handoffMutex_);
        inFlight_ = false;
    }
    handoffCv_.notify_all();
}

}  // namespace pipeline
}  // namespace voice_replacer
