#include "voice_replacer/app/app_options.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace voice_replacer {
namespace app {

namespace {

bool parseBool(const std::string& value, bool& out) {
    if (value == "1" || value == "true" || value == "TRUE" || value == "on" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "FALSE" || value == "off" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& value, int& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (!end || *end != '\0') {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool parseFloat(const std::string& value, float& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    float parsed = std::strtof(value.c_str(), &end);
    if (!end || *end != '\0') {
        return false;
    }
    out = parsed;
    return true;
}

// "default" or a device index
bool parseDevice(const std::string& value, int& out) {
    if (value == "default") {
        out = -1;
        return true;
    }
    return parseInt(value, out) && out >= -1;
}

}  // namespace

bool applyEnvOverrides(AppOptions& options, std::string& error) {
    if (const char* path = std::getenv("VOICE_REPLACER_CONFIG")) {
        options.configPath = path;
    }
    if (const char* level = std::getenv("VOICE_REPLACER_LOG_LEVEL")) {
        options.logLevel = logging::stringToLevel(level);
    }
    if (const char* endpoint = std::getenv("VOICE_REPLACER_ZMQ_ENDPOINT")) {
        options.zmqEndpoint = endpoint;
    }
    if (const char* zmqDisable = std::getenv("VOICE_REPLACER_DISABLE_ZMQ")) {
        bool disable = false;
        if (!parseBool(zmqDisable, disable)) {
            error = "VOICE_REPLACER_DISABLE_ZMQ must be true or false";
            return false;
        }
        options.disableZmq = disable;
    }
    return true;
}

void printHelp(const char* exeName) {
    std::cout << "voice_replacer - speak through a synthetic voice\n";
    std::cout << "Usage: " << exeName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>     Configuration file (default: config.json)\n";
    std::cout << "  --debug                 Debug logging (same as --log-level debug)\n";
    std::cout << "  -l, --log-level <lvl>   trace/debug/info/warn/error/critical/off\n";
    std::cout << "  --voice <id>            Voice to speak with (e.g. en_US-lessac-medium)\n";
    std::cout << "  --speed <x>             Speaking rate multiplier (0.5 - 2.0)\n";
    std::cout << "  --input <index>         Input device index or 'default'\n";
    std::cout << "  --output <index>        Output device index or 'default'\n";
    std::cout << "  --list-devices          List audio devices and exit\n";
    std::cout << "  --list-voices           List available voices and exit\n";
    std::cout << "  --headless              No console output; control over ZeroMQ only\n";
    std::cout << "  --zmq-endpoint <uri>    ZeroMQ REP endpoint (default: "
              << "ipc:///tmp/voice_replacer.sock)\n";
    std::cout << "  --no-zmq                Disable the ZeroMQ control API\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << std::endl;
}

bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error) {
    showHelp = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        const bool hasValue = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            showHelp = true;
            return false;
        }
        if ((arg == "-c" || arg == "--config") && hasValue) {
            options.configPath = argv[++i];
            continue;
        }
        if (arg == "--debug") {
            options.logLevel = logging::LogLevel::Debug;
            continue;
        }
        if ((arg == "-l" || arg == "--log-level") && hasValue) {
            options.logLevel = logging::stringToLevel(argv[++i]);
            continue;
        }
        if (arg == "--voice" && hasValue) {
            options.voice = argv[++i];
            continue;
        }
        if (arg == "--speed" && hasValue) {
            float speed = 0.0f;
            std::string value = argv[++i];
            if (!parseFloat(value, speed) || speed < kMinSpeed || speed > kMaxSpeed) {
                error = "Invalid --speed: " + value + " (expected 0.5 - 2.0)";
                return false;
            }
            options.speed = speed;
            continue;
        }
        if ((arg == "--input" || arg == "--output") && hasValue) {
            int index = -1;
            std::string value = argv[++i];
            if (!parseDevice(value, index)) {
                error = "Invalid " + arg + ": " + value;
                return false;
            }
            if (arg == "--input") {
                options.inputDevice = index;
            } else {
                options.outputDevice = index;
            }
            continue;
        }
        if (arg == "--list-devices") {
            options.listDevices = true;
            continue;
        }
        if (arg == "--list-voices") {
            options.listVoices = true;
            continue;
        }
        if (arg == "--headless") {
            options.headless = true;
            continue;
        }
        if (arg == "--zmq-endpoint" && hasValue) {
            options.zmqEndpoint = argv[++i];
            continue;
        }
        if (arg == "--no-zmq") {
            options.disableZmq = true;
            continue;
        }

        error = "Unknown argument: " + arg;
        return false;
    }
    return true;
}

void applyToConfig(const AppOptions& options, AppConfig& config) {
    if (options.voice) {
        config.synthesizer.voice = *options.voice;
    }
    if (options.speed) {
        config.synthesizer.speed = *options.speed;
    }
    if (options.inputDevice) {
        config.audio.inputDevice = *options.inputDevice;
    }
    if (options.outputDevice) {
        config.audio.outputDevice = *options.outputDevice;
    }
    if (options.zmqEndpoint) {
        config.control.endpoint = *options.zmqEndpoint;
    }
    if (options.disableZmq) {
        config.control.enabled = false;
    }
    if (options.headless) {
        config.control.headless = true;
    }
}

}  // namespace app
}  // namespace voice_replacer
