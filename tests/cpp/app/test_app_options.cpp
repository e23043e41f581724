/**
 * @file test_app_options.cpp
 * @brief Unit tests for command line and environment overrides
 */

#include "voice_replacer/app/app_options.h"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace voice_replacer;
using namespace voice_replacer::app;

namespace {

struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> pointers;

    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "voice_replacer");
        for (auto& s : storage) {
            pointers.push_back(s.data());
        }
    }
    int argc() const {
        return static_cast<int>(pointers.size());
    }
    char** argv() {
        return pointers.data();
    }
};

bool parse(std::vector<std::string> args, AppOptions& options, bool& showHelp,
           std::string& error) {
    Argv argv(std::move(args));
    return parseArgs(argv.argc(), argv.argv(), options, showHelp, error);
}

}  // namespace

TEST(AppOptions, NoArgumentsKeepsDefaults) {
    AppOptions options;
    bool showHelp = false;
    std::string error;
    EXPECT_TRUE(parse({}, options, showHelp, error));
    EXPECT_EQ(options.configPath, DEFAULT_CONFIG_FILE);
    EXPECT_FALSE(options.voice.has_value());
    EXPECT_FALSE(options.headless);
}

TEST(AppOptions, ParsesAllOptions) {
    AppOptions options;
    bool showHelp = false;
    std::string error;
    ASSERT_TRUE(parse({"-c", "/etc/vr.json", "--voice", "en_GB-alan-medium", "--speed", "1.25",
                       "--input", "1", "--output", "default", "--list-devices", "--list-voices",
                       "--headless", "--zmq-endpoint", "tcp://127.0.0.1:5555", "-l", "warn"},
                      options, showHelp, error))
        << error;

    EXPECT_EQ(options.configPath, "/etc/vr.json");
    EXPECT_EQ(*options.voice, "en_GB-alan-medium");
    EXPECT_FLOAT_EQ(*options.speed, 1.25f);
    EXPECT_EQ(*options.inputDevice, 1);
    EXPECT_EQ(*options.outputDevice, -1);
    EXPECT_TRUE(options.listDevices);
    EXPECT_TRUE(options.listVoices);
    EXPECT_TRUE(options.headless);
    EXPECT_EQ(*options.zmqEndpoint, "tcp://127.0.0.1:5555");
    EXPECT_EQ(*options.logLevel, logging::LogLevel::Warn);
}

TEST(AppOptions, DebugFlagSetsDebugLevel) {
    AppOptions options;
    bool showHelp = false;
    std::string error;
    ASSERT_TRUE(parse({"--debug", "--no-zmq"}, options, showHelp, error));
    EXPECT_EQ(*options.logLevel, logging::LogLevel::Debug);
    EXPECT_TRUE(options.disableZmq);
}

TEST(AppOptions, HelpRequested) {
    AppOptions options;
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parse({"--help"}, options, showHelp, error));
    EXPECT_TRUE(showHelp);
    EXPECT_TRUE(error.empty());
}

TEST(AppOptions, SpeedOutOfRangeIsRejected) {
    AppOptions options;
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parse({"--speed", "3.0"}, options, showHelp, error));
    EXPECT_FALSE(showHelp);
    EXPECT_NE(error.find("--speed"), std::string::npos);

    error.clear();
    EXPECT_FALSE(parse({"--speed", "fast"}, options, showHelp, error));
    EXPECT_FALSE(error.empty());
}

TEST(AppOptions, InvalidDeviceIsRejected) {
    AppOptions options;
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parse({"--input", "-2"}, options, showHelp, error));
    EXPECT_EQ(error, "Invalid --input: -2");
    EXPECT_FALSE(parse({"--output", "usb"}, options, showHelp, error));
}

TEST(AppOptions, UnknownArgument) {
    AppOptions options;
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parse({"--bogus"}, options, showHelp, error));
    EXPECT_EQ(error, "Unknown argument: --bogus");
}

TEST(AppOptions, OptionMissingItsValueIsUnknown) {
    AppOptions options;
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parse({"--voice"}, options, showHelp, error));
    EXPECT_EQ(error, "Unknown argument: --voice");
}

TEST(AppOptions, ApplyToConfigOverridesOnlySetFields) {
    AppConfig config;
    config.synthesizer.voice = "en_US-amy-medium";
    config.audio.inputDevice = 2;

    AppOptions options;
    options.speed = 0.75f;
    options.outputDevice = 1;
    options.disableZmq = true;
    options.headless = true;
    applyToConfig(options, config);

    EXPECT_EQ(config.synthesizer.voice, "en_US-amy-medium");
    EXPECT_FLOAT_EQ(config.synthesizer.speed, 0.75f);
    EXPECT_EQ(config.audio.inputDevice, 2);
    EXPECT_EQ(config.audio.outputDevice, 1);
    EXPECT_FALSE(config.control.enabled);
    EXPECT_TRUE(config.control.headless);
}

class AppOptionsEnvTest : public ::testing::Test {
   protected:
    void TearDown() override {
        unsetenv("VOICE_REPLACER_CONFIG");
        unsetenv("VOICE_REPLACER_ZMQ_ENDPOINT");
        unsetenv("VOICE_REPLACER_DISABLE_ZMQ");
        unsetenv("VOICE_REPLACER_LOG_LEVEL");
    }
};

TEST_F(AppOptionsEnvTest, ReadsEnvironment) {
    setenv("VOICE_REPLACER_CONFIG", "/tmp/vr.json", 1);
    setenv("VOICE_REPLACER_ZMQ_ENDPOINT", "ipc:///tmp/vr_test.sock", 1);
    setenv("VOICE_REPLACER_DISABLE_ZMQ", "true", 1);
    setenv("VOICE_REPLACER_LOG_LEVEL", "error", 1);

    AppOptions options;
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(options, error)) << error;
    EXPECT_EQ(options.configPath, "/tmp/vr.json");
    EXPECT_EQ(*options.zmqEndpoint, "ipc:///tmp/vr_test.sock");
    EXPECT_TRUE(options.disableZmq);
    EXPECT_EQ(*options.logLevel, logging::LogLevel::Error);
}

TEST_F(AppOptionsEnvTest, MalformedBoolIsAnError) {
    setenv("VOICE_REPLACER_DISABLE_ZMQ", "maybe", 1);
    AppOptions options;
    std::string error;
    EXPECT_FALSE(applyEnvOverrides(options, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(AppOptionsEnvTest, CommandLineWinsOverEnvironment) {
    setenv("VOICE_REPLACER_CONFIG", "/tmp/from_env.json", 1);
    AppOptions options;
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(options, error));
    bool showHelp = false;
    ASSERT_TRUE(parse({"--config", "/tmp/from_cli.json"}, options, showHelp, error));
    EXPECT_EQ(options.configPath, "/tmp/from_cli.json");
}
