#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace voice_replacer {
namespace pipeline {

// Device selection message. nullopt index = system default (or virtual cable
// for output when preferred).
struct DeviceSelection {
    std::optional<int> index;
};

struct DeviceChanges {
    std::optional<DeviceSelection> input;
    std::optional<DeviceSelection> output;

    bool empty() const {
        return !input && !output;
    }
};

struct VoiceChanges {
    std::optional<std::string> voice;
    std::optional<float> speed;

    bool empty() const {
        return !voice && !speed;
    }
};

/**
 * @brief Reconfiguration requests posted by the live setters.
 *
 * Newer requests of the same kind replace older ones. Device changes are taken
 * by the segmentation worker on every loop; voice/speed changes by the
 * synthesis worker before each response.
 */
class ControlMailbox {
   public:
    void postInputDevice(std::optional<int> index) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_.input = DeviceSelection{index};
    }
    void postOutputDevice(std::optional<int> index) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_.output = DeviceSelection{index};
    }
    void postVoice(std::string voiceId) {
        std::lock_guard<std::mutex> lock(mutex_);
        voices_.voice = std::move(voiceId);
    }
    void postSpeed(float speed) {
        std::lock_guard<std::mutex> lock(mutex_);
        voices_.speed = speed;
    }

    DeviceChanges takeDeviceChanges() {
        std::lock_guard<std::mutex> lock(mutex_);
        DeviceChanges changes = devices_;
        devices_ = DeviceChanges{};
        return changes;
    }
    VoiceChanges takeVoiceChanges() {
        std::lock_guard<std::mutex> lock(mutex_);
        VoiceChanges changes = voices_;
        voices_ = VoiceChanges{};
        return changes;
    }

   private:
    std::mutex mutex_;
    DeviceChanges devices_;
    VoiceChanges voices_;
};

}  // namespace pipeline
}  // namespace voice_replacer
