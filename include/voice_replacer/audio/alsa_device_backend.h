#pragma once

#include "voice_replacer/audio/device_registry.h"

namespace voice_replacer {
namespace audio {

// Lists PCM endpoints from the ALSA name hints (what `arecord -L` / `aplay -L` show)
class AlsaDeviceBackend : public DeviceBackend {
   public:
    std::vector<RawDevice> enumerate(Direction direction) override;
};

}  // namespace audio
}  // namespace voice_replacer
