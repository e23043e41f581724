#include "voice_replacer/control/control_plane.h"

#include "voice_replacer/core/config_loader.h"
#include "voice_replacer/core/error_codes.h"
#include "voice_replacer/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace voice_replacer {
namespace control {
namespace {

std::string trimmed(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string invalidParams(const ZmqRequest& request, const std::string& message) {
    return ZmqCommandServer::errorResponse(
        request, errorCodeToString(ErrorCode::IPC_INVALID_PARAMS), message);
}

std::string invalidState(const ZmqRequest& request, const std::string& message) {
    return ZmqCommandServer::errorResponse(
        request, errorCodeToString(ErrorCode::VALIDATION_INVALID_STATE), message);
}

// Text argument of a JSON ("params": {key: ...}) or text ("CMD:value") request
std::optional<std::string> stringArgument(const ZmqRequest& request, const char* key) {
    if (request.isJson) {
        auto params = request.params();
        if (params.contains(key) && params[key].is_string()) {
            return params[key].get<std::string>();
        }
        return std::nullopt;
    }
    std::string value = trimmed(request.payload);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<float> speedArgument(const ZmqRequest& request) {
    if (request.isJson) {
        auto params = request.params();
        if (params.contains("speed") && params["speed"].is_number()) {
            return params["speed"].get<float>();
        }
        return std::nullopt;
    }
    const std::string value = trimmed(request.payload);
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        float speed = std::stof(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return speed;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

}  // namespace

nlohmann::json statusToJson(const pipeline::PipelineStatus& status) {
    nlohmann::json j;
    j["state"] = pipeline::pipelineStateToString(status.state);
    j["is_speaking"] = status.isSpeaking;
    j["is_processing"] = status.isProcessing;
    j["latency_ms"] = status.latencyMs;
    j["dropped_frames"] = status.droppedFrames;
    j["last_error"] = status.lastError;
    return j;
}

nlohmann::json deviceToJson(const audio::DeviceInfo& device) {
    nlohmann::json j;
    j["index"] = device.index;
    j["name"] = device.name;
    j["pcm"] = device.pcmName;
    j["is_default"] = device.isDefault;
    j["is_virtual_cable"] = device.isVirtualCable;
    return j;
}

nlohmann::json voiceToJson(const tts::VoiceInfo& voice) {
    nlohmann::json j;
    j["id"] = voice.id;
    j["description"] = voice.description;
    j["language"] = voice.language;
    j["quality"] = voice.quality;
    j["installed"] = voice.installed;
    return j;
}

std::optional<std::optional<int>> parseDeviceArgument(const ZmqRequest& request) {
    if (request.isJson) {
        auto params = request.params();
        if (!params.contains("index")) {
            return std::nullopt;
        }
        const auto& index = params["index"];
        if (index.is_null()) {
            return std::optional<int>{};
        }
        if (index.is_number_integer()) {
            return std::optional<int>{index.get<int>()};
        }
        return std::nullopt;
    }

    const std::string value = lowercase(trimmed(request.payload));
    if (value == "default" || value == "none" || value == "-1") {
        return std::optional<int>{};
    }
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos ||
        value.size() > 6) {
        return std::nullopt;
    }
    return std::optional<int>{std::stoi(value)};
}

// ========== ControlPlane ==========

ControlPlane::ControlPlane(pipeline::PipelineController& controller, std::string endpoint,
                           std::string pubEndpoint)
    : controller_(controller), server_(std::move(endpoint), std::move(pubEndpoint)) {
    registerHandlers();
}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    return server_.start();
}

void ControlPlane::stop() {
    server_.stop();
}

void ControlPlane::registerHandlers() {
    server_.registerCommand("PING", [this](const auto& req) { return handlePing(req); });
    server_.registerCommand("STATUS", [this](const auto& req) { return handleStatus(req); });
    server_.registerCommand("START", [this](const auto& req) { return handleStart(req); });
    server_.registerCommand("STOP", [this](const auto& req) { return handleStop(req); });
    server_.registerCommand("SET_INPUT_DEVICE",
                            [this](const auto& req) { return handleSetInputDevice(req); });
    server_.registerCommand("SET_OUTPUT_DEVICE",
                            [this](const auto& req) { return handleSetOutputDevice(req); });
    server_.registerCommand("SET_VOICE", [this](const auto& req) { return handleSetVoice(req); });
    server_.registerCommand("SET_SPEED", [this](const auto& req) { return handleSetSpeed(req); });
    server_.registerCommand("LIST_DEVICES",
                            [this](const auto& req) { return handleListDevices(req); });
    server_.registerCommand("LIST_VOICES",
                            [this](const auto& req) { return handleListVoices(req); });
}

std::string ControlPlane::handlePing(const ZmqRequest& request) {
    return ZmqCommandServer::okResponse(request, "pong");
}

std::string ControlPlane::handleStatus(const ZmqRequest& request) {
    nlohmann::json data = statusToJson(controller_.status());
    data["running"] = controller_.isRunning();

    const auto selection = controller_.selection();
    nlohmann::json sel;
    sel["input_device"] =
        selection.inputDevice ? nlohmann::json(*selection.inputDevice) : nlohmann::json();
    sel["output_device"] =
        selection.outputDevice ? nlohmann::json(*selection.outputDevice) : nlohmann::json();
    sel["voice"] = selection.voice;
    sel["speed"] = selection.speed;
    data["selection"] = sel;
    data["stats"] = pipeline::statsToJson(controller_.stats());
    return ZmqCommandServer::okResponse(request, "", data);
}

std::string ControlPlane::handleStart(const ZmqRequest& request) {
    if (!controller_.isInitialized()) {
        return invalidState(request, "Pipeline not initialized");
    }
    if (controller_.isRunning()) {
        return invalidState(request, "Pipeline already running");
    }
    if (!controller_.start()) {
        const std::string detail = controller_.status().lastError;
        return ZmqCommandServer::errorResponse(
            request, errorCodeToString(ErrorCode::DEVICE_OPEN_FAILED),
            detail.empty() ? "Pipeline failed to start" : detail);
    }
    return ZmqCommandServer::okResponse(request, "Pipeline started");
}

std::string ControlPlane::handleStop(const ZmqRequest& request) {
    controller_.stop();
    return ZmqCommandServer::okResponse(request, "Pipeline stopped");
}

std::string ControlPlane::handleSetInputDevice(const ZmqRequest& request) {
    auto index = parseDeviceArgument(request);
    if (!index) {
        return invalidParams(request, "Expected a device index or 'default'");
    }
    if (!controller_.setInputDevice(*index)) {
        return ZmqCommandServer::errorResponse(
            request, errorCodeToString(ErrorCode::DEVICE_NOT_FOUND), "No such input device");
    }
    return ZmqCommandServer::okResponse(request, "Input device updated");
}

std::string ControlPlane::handleSetOutputDevice(const ZmqRequest& request) {
    auto index = parseDeviceArgument(request);
    if (!index) {
        return invalidParams(request, "Expected a device index or 'default'");
    }
    if (!controller_.setOutputDevice(*index)) {
        return ZmqCommandServer::errorResponse(
            request, errorCodeToString(ErrorCode::DEVICE_NOT_FOUND), "No such output device");
    }
    return ZmqCommandServer::okResponse(request, "Output device updated");
}

std::string ControlPlane::handleSetVoice(const ZmqRequest& request) {
    auto voice = stringArgument(request, "voice");
    if (!voice) {
        return invalidParams(request, "Expected a voice id");
    }
    if (!controller_.setVoice(*voice)) {
        return ZmqCommandServer::errorResponse(
            request, errorCodeToString(ErrorCode::SYNTHESIS_UNKNOWN_VOICE),
            "Unknown voice: " + *voice);
    }
    return ZmqCommandServer::okResponse(request, "Voice updated");
}

std::string ControlPlane::handleSetSpeed(const ZmqRequest& request) {
    auto speed = speedArgument(request);
    if (!speed) {
        return invalidParams(request, "Expected a numeric speed");
    }
    if (!controller_.setSpeed(*speed)) {
        return ZmqCommandServer::errorResponse(
            request, errorCodeToString(ErrorCode::SYNTHESIS_INVALID_SPEED),
            "Speed must be between " + std::to_string(kMinSpeed) + " and " +
                std::to_string(kMaxSpeed));
    }
    return ZmqCommandServer::okResponse(request, "Speed updated");
}

std::string ControlPlane::handleListDevices(const ZmqRequest& request) {
    nlohmann::json data;
    data["input"] = nlohmann::json::array();
    for (const auto& device : controller_.listInputDevices()) {
        data["input"].push_back(deviceToJson(device));
    }
    data["output"] = nlohmann::json::array();
    for (const auto& device : controller_.listOutputDevices()) {
        data["output"].push_back(deviceToJson(device));
    }
    auto cable = controller_.findVirtualCable();
    data["virtual_cable"] = cable ? deviceToJson(*cable) : nlohmann::json();
    return ZmqCommandServer::okResponse(request, "", data);
}

std::string ControlPlane::handleListVoices(const ZmqRequest& request) {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& entry : controller_.listVoices()) {
        data.push_back(voiceToJson(entry.second));
    }
    return ZmqCommandServer::okResponse(request, "", data);
}

// ========== ZmqPresenter ==========

ZmqPresenter::ZmqPresenter(ZmqCommandServer& server) : server_(server) {}

void ZmqPresenter::renderStatus(const pipeline::PipelineStatus& status) {
    nlohmann::json event;
    event["type"] = "status";
    event["data"] = statusToJson(status);
    server_.publish(event.dump());
}

void ZmqPresenter::renderText(const std::string& text) {
    nlohmann::json event;
    event["type"] = "text";
    event["text"] = text;
    server_.publish(event.dump());
}

void ZmqPresenter::promptError(const std::string& message) {
    nlohmann::json event;
    event["type"] = "error";
    event["message"] = message;
    server_.publish(event.dump());
}

}  // namespace control
}  // namespace voice_replacer
