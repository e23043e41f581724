#include "voice_replacer/tts/voice_catalog.h"

#include "voice_replacer/logging/logger.h"

#include <system_error>
#include <utility>

namespace voice_replacer {
namespace tts {

namespace {

const std::map<std::string, std::string>& languageNames() {
    static const std::map<std::string, std::string> kNames = {
        {"en_US", "US English"}, {"en_GB", "British English"}, {"de_DE", "German"},
        {"fr_FR", "French"},     {"es_ES", "Spanish"},         {"it_IT", "Italian"},
        {"ja_JP", "Japanese"},   {"nl_NL", "Dutch"},
    };
    return kNames;
}

std::string capitalize(std::string word) {
    if (!word.empty() && word[0] >= 'a' && word[0] <= 'z') {
        word[0] = static_cast<char>(word[0] - 'a' + 'A');
    }
    return word;
}

}  // namespace

VoiceCatalog::VoiceCatalog(std::filesystem::path voicesDir) : voicesDir_(std::move(voicesDir)) {}

const std::vector<VoiceInfo>& VoiceCatalog::presets() {
    static const std::vector<VoiceInfo> kPresets = [] {
        std::vector<VoiceInfo> voices;
        for (const char* id : {"en_US-lessac-medium", "en_US-amy-medium", "en_US-ryan-high",
                               "en_US-libritts-high", "en_GB-alan-medium",
                               "en_GB-jenny_dioco-medium", "de_DE-thorsten-medium"}) {
            voices.push_back(describe(id));
        }
        return voices;
    }();
    return kPresets;
}

VoiceInfo VoiceCatalog::describe(const std::string& id) {
    VoiceInfo info;
    info.id = id;

    const auto first = id.find('-');
    const auto last = id.rfind('-');
    if (first == std::string::npos || last == first) {
        info.description = id;
        return info;
    }

    info.language = id.substr(0, first);
    std::string speaker = id.substr(first + 1, last - first - 1);
    info.quality = id.substr(last + 1);

    auto lang = languageNames().find(info.language);
    const std::string langName = lang != languageNames().end() ? lang->second : info.language;
    for (auto& c : speaker) {
        if (c == '_') {
            c = ' ';
        }
    }
    info.description = langName + " - " + capitalize(speaker) + " (" + info.quality + " quality)";
    return info;
}

VoiceInfo VoiceCatalog::withPaths(VoiceInfo info) const {
    info.modelPath = voicesDir_ / (info.id + ".onnx");
    info.configPath = voicesDir_ / (info.id + ".onnx.json");
    std::error_code ec;
    info.installed = std::filesystem::is_regular_file(info.modelPath, ec) &&
                     std::filesystem::is_regular_file(info.configPath, ec);
    return info;
}

std::map<std::string, VoiceInfo> VoiceCatalog::listVoices() const {
    std::map<std::string, VoiceInfo> voices;
    for (const auto& preset : presets()) {
        voices.emplace(preset.id, withPaths(preset));
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(voicesDir_, ec)) {
        return voices;
    }
    for (const auto& entry : std::filesystem::directory_iterator(voicesDir_, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".onnx") {
            continue;
        }
        const std::string id = entry.path().stem().string();
        if (voices.count(id) != 0) {
            continue;
        }
        VoiceInfo info = withPaths(describe(id));
        if (!info.installed) {
            LOG_DEBUG("[VoiceCatalog] Skipping {}: missing {}", id, info.configPath.string());
            continue;
        }
        voices.emplace(id, std::move(info));
    }
    if (ec) {
        LOG_WARN("[VoiceCatalog] Cannot scan {}: {}", voicesDir_.string(), ec.message());
    }
    return voices;
}

std::optional<VoiceInfo> VoiceCatalog::find(const std::string& id) const {
    auto voices = listVoices();
    auto it = voices.find(id);
    if (it == voices.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace tts
}  // namespace voice_replacer
