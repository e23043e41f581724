#include "voice_replacer/audio/alsa_device_backend.h"

#include "voice_replacer/core/errors.h"
#include "voice_replacer/logging/logger.h"

#include <alsa/asoundlib.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace voice_replacer {
namespace audio {

namespace {

struct HintStringDeleter {
    void operator()(char* p) const {
        std::free(p);
    }
};
using HintString = std::unique_ptr<char, HintStringDeleter>;

std::string collapseLines(const char* text) {
    std::string out;
    if (!text) {
        return out;
    }
    for (const char* p = text; *p; ++p) {
        if (*p == '\n') {
            out += " - ";
        } else {
            out.push_back(*p);
        }
    }
    return out;
}

}  // namespace

std::vector<RawDevice> AlsaDeviceBackend::enumerate(Direction direction) {
    void** hints = nullptr;
    int rc = snd_device_name_hint(-1, "pcm", &hints);
    if (rc < 0) {
        throw DeviceError(std::string("snd_device_name_hint failed: ") + snd_strerror(rc),
                          ErrorCode::DEVICE_ENUMERATION_FAILED);
    }

    // IOID is absent for endpoints usable in both directions
    const char* wanted = direction == Direction::Input ? "Input" : "Output";
    std::vector<RawDevice> devices;
    for (void** hint = hints; *hint != nullptr; ++hint) {
        HintString name(snd_device_name_get_hint(*hint, "NAME"));
        HintString desc(snd_device_name_get_hint(*hint, "DESC"));
        HintString ioid(snd_device_name_get_hint(*hint, "IOID"));

        if (!name) {
            continue;
        }
        if (ioid && std::string(ioid.get()) != wanted) {
            continue;
        }
        std::string pcmName = name.get();
        if (pcmName == "null") {
            continue;
        }

        RawDevice device;
        device.pcmName = pcmName;
        device.description = collapseLines(desc.get());
        device.isDefault = (pcmName == kDefaultPcmName || pcmName == "sysdefault");
        devices.push_back(std::move(device));
    }
    snd_device_name_free_hint(hints);

    LOG_DEBUG("[AlsaDeviceBackend] {} {} devices", devices.size(),
              direction == Direction::Input ? "input" : "output");
    return devices;
}

}  // namespace audio
}  // namespace voice_replacer
