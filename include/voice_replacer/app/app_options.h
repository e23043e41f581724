#pragma once

#include "voice_replacer/core/config_loader.h"
#include "voice_replacer/logging/logger.h"

#include <optional>
#include <string>

namespace voice_replacer {
namespace app {

// Command line overrides. Unset fields keep the value from config.json.
struct AppOptions {
    std::string configPath = DEFAULT_CONFIG_FILE;
    std::optional<logging::LogLevel> logLevel;  // --debug implies Debug
    std::optional<std::string> voice;
    std::optional<float> speed;
    std::optional<int> inputDevice;   // -1 = system default
    std::optional<int> outputDevice;  // -1 = virtual cable if found, else default
    std::optional<std::string> zmqEndpoint;
    bool disableZmq = false;
    bool headless = false;
    bool listDevices = false;
    bool listVoices = false;
};

// Environment overrides (VOICE_REPLACER_CONFIG, VOICE_REPLACER_LOG_LEVEL,
// VOICE_REPLACER_ZMQ_ENDPOINT, VOICE_REPLACER_DISABLE_ZMQ). Returns false with
// an error message on a malformed value.
bool applyEnvOverrides(AppOptions& options, std::string& error);

// Parse CLI arguments. showHelp=true means only the help text was requested.
bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error);

// Fold the overrides into a loaded configuration
void applyToConfig(const AppOptions& options, AppConfig& config);

void printHelp(const char* exeName);

}  // namespace app
}  // namespace voice_replacer
