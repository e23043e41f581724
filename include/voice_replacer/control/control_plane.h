#pragma once

#include "voice_replacer/audio/device_registry.h"
#include "voice_replacer/control/zmq_server.h"
#include "voice_replacer/pipeline/pipeline_controller.h"
#include "voice_replacer/tts/voice_catalog.h"
#include "voice_replacer/ui/presenter.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace voice_replacer {
namespace control {

nlohmann::json statusToJson(const pipeline::PipelineStatus& status);
nlohmann::json deviceToJson(const audio::DeviceInfo& device);
nlohmann::json voiceToJson(const tts::VoiceInfo& voice);

/**
 * @brief Device selection argument of SET_INPUT_DEVICE / SET_OUTPUT_DEVICE.
 *
 * JSON: {"params": {"index": 3}} or {"params": {"index": null}}.
 * Text: "SET_INPUT_DEVICE:3" or "SET_INPUT_DEVICE:default".
 * Outer nullopt means the argument was missing or malformed.
 */
std::optional<std::optional<int>> parseDeviceArgument(const ZmqRequest& request);

/**
 * @brief Remote control of a running pipeline over ZeroMQ.
 *
 * Commands: PING, STATUS, START, STOP, SET_INPUT_DEVICE, SET_OUTPUT_DEVICE,
 * SET_VOICE, SET_SPEED, LIST_DEVICES, LIST_VOICES.
 */
class ControlPlane {
   public:
    ControlPlane(pipeline::PipelineController& controller, std::string endpoint,
                 std::string pubEndpoint = "");
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();
    bool isRunning() const {
        return server_.isRunning();
    }

    ZmqCommandServer& server() {
        return server_;
    }

   private:
    void registerHandlers();

    std::string handlePing(const ZmqRequest& request);
    std::string handleStatus(const ZmqRequest& request);
    std::string handleStart(const ZmqRequest& request);
    std::string handleStop(const ZmqRequest& request);
    std::string handleSetInputDevice(const ZmqRequest& request);
    std::string handleSetOutputDevice(const ZmqRequest& request);
    std::string handleSetVoice(const ZmqRequest& request);
    std::string handleSetSpeed(const ZmqRequest& request);
    std::string handleListDevices(const ZmqRequest& request);
    std::string handleListVoices(const ZmqRequest& request);

    pipeline::PipelineController& controller_;
    ZmqCommandServer server_;
};

// Publishes pipeline events as JSON on the control plane's PUB socket
class ZmqPresenter : public ui::Presenter {
   public:
    explicit ZmqPresenter(ZmqCommandServer& server);

    void renderStatus(const pipeline::PipelineStatus& status) override;
    void renderText(const std::string& text) override;
    void promptError(const std::string& message) override;

   private:
    ZmqCommandServer& server_;
};

}  // namespace control
}  // namespace voice_replacer
