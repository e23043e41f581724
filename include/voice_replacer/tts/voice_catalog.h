#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace voice_replacer {
namespace tts {

struct VoiceInfo {
    std::string id;  // e.g. "en_US-lessac-medium"
    std::string description;
    std::string language;  // e.g. "en_US"
    std::string quality;   // x_low, low, medium, high
    std::filesystem::path modelPath;
    std::filesystem::path configPath;
    bool installed = false;  // Model and config present in the voices directory
};

/**
 * @brief Known voices: built-in presets plus any "<id>.onnx" (with its
 * "<id>.onnx.json") found in the voices directory.
 */
class VoiceCatalog {
   public:
    explicit VoiceCatalog(std::filesystem::path voicesDir);

    std::map<std::string, VoiceInfo> listVoices() const;
    std::optional<VoiceInfo> find(const std::string& id) const;

    const std::filesystem::path& voicesDir() const {
        return voicesDir_;
    }

    static const std::vector<VoiceInfo>& presets();

    // Split "<lang>-<name>-<quality>" into a VoiceInfo (paths left empty)
    static VoiceInfo describe(const std::string& id);

   private:
    VoiceInfo withPaths(VoiceInfo info) const;

    std::filesystem::path voicesDir_;
};

}  // namespace tts
}  // namespace voice_replacer
