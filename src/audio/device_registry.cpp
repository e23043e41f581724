#include "voice_replacer/audio/device_registry.h"

#include "voice_replacer/core/errors.h"
#include "voice_replacer/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace voice_replacer {
namespace audio {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const char* directionName(Direction direction) {
    return direction == Direction::Input ? "input" : "output";
}

}  // namespace

DeviceRegistry::DeviceRegistry(std::shared_ptr<DeviceBackend> backend)
    : backend_(std::move(backend)) {}

const std::vector<std::string>& DeviceRegistry::knownVirtualCableNames() {
    static const std::vector<std::string> kNames = {
        "CABLE Input", "VB-Audio", "VoiceMeeter", "Virtual Cable",
        "BlackHole",   "Loopback", "Virtual Mic",
    };
    return kNames;
}

bool DeviceRegistry::isVirtualCableName(const std::string& name) {
    const std::string lower = toLower(name);
    for (const auto& known : knownVirtualCableNames()) {
        if (lower.find(toLower(known)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<DeviceInfo> DeviceRegistry::list(Direction direction) const {
    std::vector<DeviceInfo> devices;
    if (!backend_) {
        return devices;
    }

    std::vector<RawDevice> raw;
    try {
        raw = backend_->enumerate(direction);
    } catch (const std::exception& e) {
        LOG_WARN("[DeviceRegistry] {} enumeration failed: {}", directionName(direction),
                 e.what());
        return devices;
    }

    devices.reserve(raw.size());
    for (auto& entry : raw) {
        DeviceInfo info;
        info.index = static_cast<int>(devices.size());
        info.name = entry.description.empty() ? entry.pcmName : entry.description;
        info.pcmName = std::move(entry.pcmName);
        info.isDefault = entry.isDefault;
        // Match on both so ALSA card ids like "hw:Loopback" count as well
        info.isVirtualCable = isVirtualCableName(info.name) || isVirtualCableName(info.pcmName);
        devices.push_back(std::move(info));
    }
    return devices;
}

std::vector<DeviceInfo> DeviceRegistry::listInputDevices() const {
    return list(Direction::Input);
}

std::vector<DeviceInfo> DeviceRegistry::listOutputDevices() const {
    return list(Direction::Output);
}

std::optional<DeviceInfo> DeviceRegistry::findVirtualCable() const {
    for (auto& device : listOutputDevices()) {
        if (device.isVirtualCable) {
            return device;
        }
    }
    return std::nullopt;
}

std::string DeviceRegistry::resolve(Direction direction, std::optional<int> index) const {
    if (!index.has_value()) {
        return kDefaultPcmName;
    }
    auto devices = list(direction);
    if (*index < 0 || *index >= static_cast<int>(devices.size())) {
        throw DeviceError(std::string("no ") + directionName(direction) + " device with index " +
                              std::to_string(*index),
                          ErrorCode::DEVICE_NOT_FOUND);
    }
    return devices[static_cast<size_t>(*index)].pcmName;
}

std::string DeviceRegistry::resolveInput(std::optional<int> index) const {
    return resolve(Direction::Input, index);
}

std::string DeviceRegistry::resolveOutput(std::optional<int> index) const {
    return resolve(Direction::Output, index);
}

}  // namespace audio
}  // namespace voice_replacer
