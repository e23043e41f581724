/**
 * @file test_control_plane.cpp
 * @brief ZeroMQ command handlers and event publishing against a pipeline over fakes
 */

#include "fakes/fake_components.h"
#include "voice_replacer/control/control_plane.h"
#include "voice_replacer/pipeline/pipeline_controller.h"

#include <atomic>
#include <functional>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>
#include <zmq.hpp>

using namespace voice_replacer;
using namespace voice_replacer::control;
using namespace test_fakes;

namespace {

std::string make_ipc_endpoint() {
    static std::atomic<int> counter{0};
    std::ostringstream oss;
    oss << "ipc:///tmp/voice_replacer_control_test_" << ::getpid() << "_" << counter++
        << ".sock";
    return oss.str();
}

std::string read_message(zmq::socket_t& socket) {
    zmq::message_t reply;
    auto result = socket.recv(reply, zmq::recv_flags::none);
    if (!result) {
        return {};
    }
    return std::string(static_cast<char*>(reply.data()), reply.size());
}

ZmqRequest jsonRequest(const nlohmann::json& body) {
    return ZmqCommandServer::parseRequest(body.dump());
}

}  // namespace

// ============================================================
// Device argument parsing
// ============================================================

TEST(ParseDeviceArgument, JsonIndexAndNull) {
    auto index = parseDeviceArgument(jsonRequest({{"cmd", "SET_INPUT_DEVICE"},
                                                  {"params", {{"index", 3}}}}));
    ASSERT_TRUE(index.has_value());
    ASSERT_TRUE(index->has_value());
    EXPECT_EQ(**index, 3);

    auto reset = parseDeviceArgument(jsonRequest({{"cmd", "SET_INPUT_DEVICE"},
                                                  {"params", {{"index", nullptr}}}}));
    ASSERT_TRUE(reset.has_value());
    EXPECT_FALSE(reset->has_value());
}

TEST(ParseDeviceArgument, JsonMissingOrWrongType) {
    EXPECT_FALSE(parseDeviceArgument(jsonRequest({{"cmd", "SET_INPUT_DEVICE"}})).has_value());
    EXPECT_FALSE(parseDeviceArgument(jsonRequest({{"cmd", "SET_INPUT_DEVICE"},
                                                  {"params", {{"index", "two"}}}}))
                     .has_value());
    EXPECT_FALSE(parseDeviceArgument(jsonRequest({{"cmd", "SET_INPUT_DEVICE"},
                                                  {"params", {{"index", 1.5}}}}))
                     .has_value());
}

TEST(ParseDeviceArgument, TextForms) {
    auto index = parseDeviceArgument(ZmqCommandServer::parseRequest("SET_OUTPUT_DEVICE: 2 "));
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(index->value(), 2);

    for (const char* text : {"SET_OUTPUT_DEVICE:default", "SET_OUTPUT_DEVICE:Default",
                             "SET_OUTPUT_DEVICE:none", "SET_OUTPUT_DEVICE:-1"}) {
        auto reset = parseDeviceArgument(ZmqCommandServer::parseRequest(text));
        ASSERT_TRUE(reset.has_value()) << text;
        EXPECT_FALSE(reset->has_value()) << text;
    }

    for (const char* text : {"SET_OUTPUT_DEVICE", "SET_OUTPUT_DEVICE:", "SET_OUTPUT_DEVICE:-5",
                             "SET_OUTPUT_DEVICE:abc", "SET_OUTPUT_DEVICE:99999999"}) {
        EXPECT_FALSE(parseDeviceArgument(ZmqCommandServer::parseRequest(text)).has_value())
            << text;
    }
}

// ============================================================
// JSON views
// ============================================================

TEST(ControlJson, StatusFields) {
    pipeline::PipelineStatus status;
    status.state = pipeline::PipelineState::Speaking;
    status.isSpeaking = true;
    status.isProcessing = true;
    status.latencyMs = 420.0;
    status.droppedFrames = 3;
    status.lastError = "";

    auto j = statusToJson(status);
    EXPECT_EQ(j["state"], "speaking");
    EXPECT_TRUE(j["is_speaking"].get<bool>());
    EXPECT_TRUE(j["is_processing"].get<bool>());
    EXPECT_DOUBLE_EQ(j["latency_ms"].get<double>(), 420.0);
    EXPECT_EQ(j["dropped_frames"], 3);
    EXPECT_EQ(j["last_error"], "");
}

TEST(ControlJson, DeviceAndVoiceFields) {
    audio::DeviceInfo device;
    device.index = 2;
    device.name = "Loopback PCM";
    device.pcmName = "hw:Loopback,0,0";
    device.isVirtualCable = true;
    auto d = deviceToJson(device);
    EXPECT_EQ(d["index"], 2);
    EXPECT_EQ(d["pcm"], "hw:Loopback,0,0");
    EXPECT_TRUE(d["is_virtual_cable"].get<bool>());
    EXPECT_FALSE(d["is_default"].get<bool>());

    auto v = voiceToJson(tts::VoiceCatalog::describe("en_GB-alan-medium"));
    EXPECT_EQ(v["id"], "en_GB-alan-medium");
    EXPECT_EQ(v["language"], "en_GB");
    EXPECT_EQ(v["quality"], "medium");
}

// ============================================================
// Live control plane
// ============================================================

class ControlPlaneTest : public ::testing::Test {
   protected:
    std::shared_ptr<FakeDeviceBackend> backend = makeStandardBackend();
    std::shared_ptr<CaptureState> captureState = std::make_shared<CaptureState>();
    std::shared_ptr<PlaybackState> playbackState = std::make_shared<PlaybackState>();
    std::shared_ptr<RecognizerState> recognizerState = std::make_shared<RecognizerState>();
    std::shared_ptr<SynthesizerState> synthState = std::make_shared<SynthesizerState>();

    AppConfig config;
    std::unique_ptr<pipeline::PipelineController> controller;
    std::unique_ptr<ControlPlane> plane;
    std::string endpoint;

    zmq::context_t ctx{1};
    zmq::socket_t req{ctx, zmq::socket_type::req};

    void SetUp() override {
        config.synthesizer.voicesDir = "/nonexistent/voices";
        config.pipeline.statusIntervalMs = 50;

        pipeline::PipelineComponents components;
        components.deviceBackend = backend;
        components.captureSource = std::make_unique<FakeCaptureSource>(captureState);
        components.playbackSink = std::make_unique<FakePlaybackSink>(playbackState);
        components.recognitionEngine = std::make_unique<FakeRecognitionEngine>(recognizerState);
        components.synthesisEngine = std::make_unique<FakeSynthesisEngine>(synthState);
        controller = std::make_unique<pipeline::PipelineController>(config, std::move(components));

        endpoint = make_ipc_endpoint();
        plane = std::make_unique<ControlPlane>(*controller, endpoint);
        ASSERT_TRUE(plane->start());

        req.set(zmq::sockopt::rcvtimeo, 3000);
        req.set(zmq::sockopt::linger, 0);
        req.connect(endpoint);
    }

    void TearDown() override {
        req.close();
        plane->stop();
        controller->stop();
    }

    nlohmann::json send(const std::string& cmd, const nlohmann::json& params = nullptr) {
        nlohmann::json body;
        body["cmd"] = cmd;
        if (!params.is_null()) {
            body["params"] = params;
        }
        req.send(zmq::buffer(body.dump()), zmq::send_flags::none);
        auto reply = read_message(req);
        EXPECT_FALSE(reply.empty()) << cmd;
        return reply.empty() ? nlohmann::json() : nlohmann::json::parse(reply);
    }

    std::string sendText(const std::string& message) {
        req.send(zmq::buffer(message), zmq::send_flags::none);
        return read_message(req);
    }
};

TEST_F(ControlPlaneTest, PingAnswersPong) {
    auto resp = send("PING");
    EXPECT_EQ(resp["status"], "ok");
    EXPECT_EQ(resp["message"], "pong");
    EXPECT_EQ(sendText("PING"), "OK:pong");
}

TEST_F(ControlPlaneTest, StartRequiresInitialization) {
    auto resp = send("START");
    EXPECT_EQ(resp["status"], "error");
    EXPECT_EQ(resp["error_code"], "VALIDATION_INVALID_STATE");
    EXPECT_FALSE(controller->isRunning());
}

TEST_F(ControlPlaneTest, StartStopAndStatus) {
    ASSERT_TRUE(controller->initialize());

    auto idle = send("STATUS");
    EXPECT_EQ(idle["status"], "ok");
    EXPECT_EQ(idle["data"]["state"], "idle");
    EXPECT_FALSE(idle["data"]["running"].get<bool>());
    EXPECT_EQ(idle["data"]["selection"]["voice"], "en_US-lessac-medium");

    EXPECT_EQ(send("START")["status"], "ok");
    EXPECT_TRUE(controller->isRunning());

    auto again = send("START");
    EXPECT_EQ(again["status"], "error");
    EXPECT_EQ(again["error_code"], "VALIDATION_INVALID_STATE");

    ASSERT_TRUE(waitFor([&] { return controller->state() == pipeline::PipelineState::Listening; }));
    auto running = send("STATUS");
    EXPECT_EQ(running["data"]["state"], "listening");
    EXPECT_TRUE(running["data"]["running"].get<bool>());
    EXPECT_FALSE(running["data"]["is_speaking"].get<bool>());
    EXPECT_TRUE(running["data"].contains("stats"));

    EXPECT_EQ(send("STOP")["status"], "ok");
    EXPECT_FALSE(controller->isRunning());
    // Stopping twice is harmless
    EXPECT_EQ(send("STOP")["status"], "ok");
}

TEST_F(ControlPlaneTest, StartFailureReportsDeviceError) {
    ASSERT_TRUE(controller->initialize());
    {
        std::lock_guard<std::mutex> lock(captureState->mutex);
        captureState->failingDevices.insert("default");
    }

    auto resp = send("START");
    EXPECT_EQ(resp["status"], "error");
    EXPECT_EQ(resp["error_code"], "DEVICE_OPEN_FAILED");
    EXPECT_FALSE(controller->isRunning());
}

TEST_F(ControlPlaneTest, SetVoice) {
    EXPECT_EQ(send("SET_VOICE", {{"voice", "en_GB-alan-medium"}})["status"], "ok");
    EXPECT_EQ(controller->selection().voice, "en_GB-alan-medium");

    auto unknown = send("SET_VOICE", {{"voice", "xx_XX-nobody-low"}});
    EXPECT_EQ(unknown["status"], "error");
    EXPECT_EQ(unknown["error_code"], "SYNTHESIS_UNKNOWN_VOICE");

    auto missing = send("SET_VOICE");
    EXPECT_EQ(missing["error_code"], "IPC_INVALID_PARAMS");

    EXPECT_EQ(sendText("SET_VOICE:en_US-amy-medium"), "OK:Voice updated");
    EXPECT_EQ(controller->selection().voice, "en_US-amy-medium");
}

TEST_F(ControlPlaneTest, SetSpeed) {
    EXPECT_EQ(send("SET_SPEED", {{"speed", 1.5}})["status"], "ok");
    EXPECT_FLOAT_EQ(controller->selection().speed, 1.5f);

    auto tooFast = send("SET_SPEED", {{"speed", 3.0}});
    EXPECT_EQ(tooFast["status"], "error");
    EXPECT_EQ(tooFast["error_code"], "SYNTHESIS_INVALID_SPEED");
    EXPECT_FLOAT_EQ(controller->selection().speed, 1.5f);

    EXPECT_EQ(send("SET_SPEED", {{"speed", "fast"}})["error_code"], "IPC_INVALID_PARAMS");

    EXPECT_EQ(sendText("SET_SPEED:0.75"), "OK:Speed updated");
    EXPECT_FLOAT_EQ(controller->selection().speed, 0.75f);
    EXPECT_EQ(sendText("SET_SPEED:0.75x").rfind("ERR:", 0), 0u);
}

TEST_F(ControlPlaneTest, SetDevices) {
    EXPECT_EQ(send("SET_INPUT_DEVICE", {{"index", 1}})["status"], "ok");
    EXPECT_EQ(controller->selection().inputDevice, std::optional<int>(1));

    EXPECT_EQ(sendText("SET_OUTPUT_DEVICE:2"), "OK:Output device updated");
    EXPECT_EQ(controller->selection().outputDevice, std::optional<int>(2));

    EXPECT_EQ(send("SET_OUTPUT_DEVICE", {{"index", nullptr}})["status"], "ok");
    EXPECT_FALSE(controller->selection().outputDevice.has_value());

    auto unknown = send("SET_INPUT_DEVICE", {{"index", 9}});
    EXPECT_EQ(unknown["status"], "error");
    EXPECT_EQ(unknown["error_code"], "DEVICE_NOT_FOUND");

    EXPECT_EQ(send("SET_INPUT_DEVICE")["error_code"], "IPC_INVALID_PARAMS");
}

TEST_F(ControlPlaneTest, ListDevicesIncludesVirtualCable) {
    auto resp = send("LIST_DEVICES");
    ASSERT_EQ(resp["status"], "ok");
    const auto& data = resp["data"];
    EXPECT_EQ(data["input"].size(), 2u);
    ASSERT_EQ(data["output"].size(), 3u);
    EXPECT_EQ(data["output"][0]["pcm"], "default");
    EXPECT_TRUE(data["output"][0]["is_default"].get<bool>());
    EXPECT_EQ(data["virtual_cable"]["index"], 2);
    EXPECT_EQ(data["virtual_cable"]["pcm"], "hw:Loopback,0,0");
}

TEST_F(ControlPlaneTest, ListDevicesWithoutCable) {
    backend->outputs.pop_back();
    auto resp = send("LIST_DEVICES");
    ASSERT_EQ(resp["status"], "ok");
    EXPECT_TRUE(resp["data"]["virtual_cable"].is_null());
}

TEST_F(ControlPlaneTest, ListVoices) {
    auto resp = send("LIST_VOICES");
    ASSERT_EQ(resp["status"], "ok");
    ASSERT_TRUE(resp["data"].is_array());

    bool foundDefault = false;
    for (const auto& voice : resp["data"]) {
        if (voice["id"] == "en_US-lessac-medium") {
            foundDefault = true;
            EXPECT_EQ(voice["language"], "en_US");
            EXPECT_FALSE(voice["installed"].get<bool>());
        }
    }
    EXPECT_TRUE(foundDefault);
}

TEST_F(ControlPlaneTest, UnknownCommand) {
    auto resp = send("FLY");
    EXPECT_EQ(resp["error_code"], "IPC_INVALID_COMMAND");
}

TEST_F(ControlPlaneTest, PresenterPublishesPipelineEvents) {
    zmq::socket_t sub(ctx, zmq::socket_type::sub);
    sub.set(zmq::sockopt::subscribe, "");
    sub.set(zmq::sockopt::rcvtimeo, 100);
    sub.set(zmq::sockopt::linger, 0);
    sub.connect(plane->server().pubEndpoint());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    ZmqPresenter presenter(plane->server());

    // PUB drops messages until the subscription lands, so retry; late copies
    // of an earlier event are skipped by type
    auto receiveAfter = [&](const std::string& type, const std::function<void()>& emit) {
        for (int i = 0; i < 20; ++i) {
            emit();
            for (auto message = read_message(sub); !message.empty();
                 message = read_message(sub)) {
                auto event = nlohmann::json::parse(message);
                if (event["type"] == type) {
                    return event;
                }
            }
        }
        return nlohmann::json();
    };

    auto text = receiveAfter("text", [&] { presenter.renderText("hello world"); });
    EXPECT_EQ(text["type"], "text");
    EXPECT_EQ(text["text"], "hello world");

    pipeline::PipelineStatus status;
    status.state = pipeline::PipelineState::Recognizing;
    status.isProcessing = true;
    auto statusEvent = receiveAfter("status", [&] { presenter.renderStatus(status); });
    EXPECT_EQ(statusEvent["type"], "status");
    EXPECT_EQ(statusEvent["data"]["state"], "recognizing");

    auto error = receiveAfter("error", [&] { presenter.promptError("DEVICE_IO_FAILED: gone"); });
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["message"], "DEVICE_IO_FAILED: gone");
}
