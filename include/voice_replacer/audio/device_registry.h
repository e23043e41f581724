#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace voice_replacer {
namespace audio {

enum class Direction { Input, Output };

// What a backend reports for one PCM endpoint
struct RawDevice {
    std::string pcmName;      // Identifier passed to the stream open call (e.g. "hw:Loopback,0,0")
    std::string description;  // Human readable name
    bool isDefault = false;
};

struct DeviceInfo {
    int index = -1;
    std::string name;
    std::string pcmName;
    bool isDefault = false;
    bool isVirtualCable = false;
};

// Enumeration seam. Implementations may throw DeviceError.
class DeviceBackend {
   public:
    virtual ~DeviceBackend() = default;
    virtual std::vector<RawDevice> enumerate(Direction direction) = 0;
};

/**
 * @brief Read-only view of the input/output devices.
 *
 * Listing never throws: backend failures are logged and yield an empty list.
 * Indices are positions in the listing of one direction and are stable for as
 * long as the backend reports the same devices.
 */
class DeviceRegistry {
   public:
    explicit DeviceRegistry(std::shared_ptr<DeviceBackend> backend);

    std::vector<DeviceInfo> listInputDevices() const;
    std::vector<DeviceInfo> listOutputDevices() const;

    // First output whose name contains a known virtual-cable product name
    std::optional<DeviceInfo> findVirtualCable() const;

    /**
     * @brief Map a selection to the PCM name to open.
     *
     * nullopt selects the system default ("default").
     * @throws DeviceError (DEVICE_NOT_FOUND) for an index not in the listing
     */
    std::string resolveInput(std::optional<int> index) const;
    std::string resolveOutput(std::optional<int> index) const;

    static bool isVirtualCableName(const std::string& name);
    static const std::vector<std::string>& knownVirtualCableNames();

   private:
    std::vector<DeviceInfo> list(Direction direction) const;
    std::string resolve(Direction direction, std::optional<int> index) const;

    std::shared_ptr<DeviceBackend> backend_;
};

// Name of the system default PCM
constexpr const char* kDefaultPcmName = "default";

}  // namespace audio
}  // namespace voice_replacer
