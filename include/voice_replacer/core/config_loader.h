#ifndef VOICE_REPLACER_CONFIG_LOADER_H
#define VOICE_REPLACER_CONFIG_LOADER_H

#include <cstdint>
#include <filesystem>
#include <string>

namespace voice_replacer {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

// What happens when the segmenter closes an utterance while a previous one is
// still being recognized, synthesized or spoken
enum class BargeInPolicy {
    Queue,     // Hold it in the pending slot; block segmentation until taken
    Drop,      // Discard it if the pending slot is occupied
    Interrupt  // Cancel the response being spoken as soon as new speech starts
};

// What playback does with the remaining samples of the current chunk when the
// output device changes mid-result
enum class DeviceSwitchPolicy {
    Drain,   // Finish the current chunk on the old device, then switch
    Discard  // Drop the rest of the current chunk, then switch
};

struct AppConfig {
    struct AudioConfig {
        uint32_t sampleRate = 16000;           // Capture rate fed to the recognizer
        uint32_t blockFrames = 480;            // 30 ms per Frame at 16 kHz
        int inputDevice = -1;                  // -1 = system default
        int outputDevice = -1;                 // -1 = virtual cable if found, else default
        bool preferVirtualCable = true;
        uint32_t frameQueueCapacity = 64;      // ~2 s of audio at the default block size
        uint32_t playbackPeriodFrames = 1024;  // Piece size written between cancel checks
        uint32_t playbackPeriods = 4;
        DeviceSwitchPolicy switchPolicy = DeviceSwitchPolicy::Drain;
    } audio;

    struct VadConfig {
        float threshold = 0.015f;  // Smoothed RMS (normalized 0..1) separating speech from silence
        float smoothing = 0.4f;    // EMA weight of the newest frame
        int onsetFrames = 3;       // Consecutive frames above threshold to start
        int hangoverFrames = 25;   // Consecutive frames below threshold to end (~750 ms)
        int maxUtteranceMs = 15000;
    } vad;

    struct RecognizerConfig {
        std::string modelPath = "models/vosk-model-small-en-us-0.15";
        int engineLogLevel = -1;  // Vosk log level (-1 silences the engine)
    } recognizer;

    struct SynthesizerConfig {
        std::string voice = "en_US-lessac-medium";
        float speed = 1.0f;
        std::string voicesDir = "voices";
        std::string espeakDataPath = "";  // Empty = engine default
        bool useCuda = false;
    } synthesizer;

    struct PipelineConfig {
        BargeInPolicy bargeIn = BargeInPolicy::Queue;
        int statusIntervalMs = 500;  // Periodic status refresh while running
    } pipeline;

    struct ControlConfig {
        bool enabled = true;
        std::string endpoint = "ipc:///tmp/voice_replacer.sock";
        std::string pubEndpoint = "";  // Empty = endpoint + ".pub"
        bool headless = false;         // No console presenter; control plane only
    } control;
};

// Accepted speed multiplier range
constexpr float kMinSpeed = 0.5f;
constexpr float kMaxSpeed = 2.0f;

// Convert string to BargeInPolicy (returns Queue for invalid input)
BargeInPolicy parseBargeInPolicy(const std::string& str);
const char* bargeInPolicyToString(BargeInPolicy policy);

// Convert string to DeviceSwitchPolicy (returns Drain for invalid input)
DeviceSwitchPolicy parseDeviceSwitchPolicy(const std::string& str);
const char* deviceSwitchPolicyToString(DeviceSwitchPolicy policy);

/**
 * @brief Load configuration from JSON.
 *
 * Missing file -> defaults, returns false. Parse error -> defaults, returns
 * false. Out-of-range values are clamped with a warning.
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

/**
 * @brief Write configuration back as JSON.
 *
 * Keeps unknown top-level keys (e.g. the "logging" section) of an existing
 * file untouched.
 */
bool saveAppConfig(const std::filesystem::path& configPath, const AppConfig& config);

}  // namespace voice_replacer

#endif  // VOICE_REPLACER_CONFIG_LOADER_H
