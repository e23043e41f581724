#include "voice_replacer/core/config_loader.h"

#include "voice_replacer/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace voice_replacer {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

template <typename T>
void clampWithWarning(T& value, T lo, T hi, const char* name, bool verbose) {
    T clamped = std::clamp(value, lo, hi);
    if (clamped != value && verbose) {
        LOG_WARN("Config: {} out of range ({}), clamped to {}", name, value, clamped);
    }
    value = clamped;
}

void parseAudio(const nlohmann::json& a, AppConfig::AudioConfig& out) {
    if (a.contains("sampleRate") && a["sampleRate"].is_number_integer()) {
        out.sampleRate = a["sampleRate"].get<uint32_t>();
    }
    if (a.contains("blockFrames") && a["blockFrames"].is_number_integer()) {
        out.blockFrames = a["blockFrames"].get<uint32_t>();
    }
    if (a.contains("inputDevice") && a["inputDevice"].is_number_integer()) {
        out.inputDevice = a["inputDevice"].get<int>();
    }
    if (a.contains("outputDevice") && a["outputDevice"].is_number_integer()) {
        out.outputDevice = a["outputDevice"].get<int>();
    }
    if (a.contains("preferVirtualCable") && a["preferVirtualCable"].is_boolean()) {
        out.preferVirtualCable = a["preferVirtualCable"].get<bool>();
    }
    if (a.contains("frameQueueCapacity") && a["frameQueueCapacity"].is_number_integer()) {
        out.frameQueueCapacity = a["frameQueueCapacity"].get<uint32_t>();
    }
    if (a.contains("playbackPeriodFrames") && a["playbackPeriodFrames"].is_number_integer()) {
        out.playbackPeriodFrames = a["playbackPeriodFrames"].get<uint32_t>();
    }
    if (a.contains("playbackPeriods") && a["playbackPeriods"].is_number_integer()) {
        out.playbackPeriods = a["playbackPeriods"].get<uint32_t>();
    }
    if (a.contains("switchPolicy") && a["switchPolicy"].is_string()) {
        out.switchPolicy = parseDeviceSwitchPolicy(a["switchPolicy"].get<std::string>());
    }
}

void parseVad(const nlohmann::json& v, AppConfig::VadConfig& out) {
    if (v.contains("threshold") && v["threshold"].is_number()) {
        out.threshold = v["threshold"].get<float>();
    }
    if (v.contains("smoothing") && v["smoothing"].is_number()) {
        out.smoothing = v["smoothing"].get<float>();
    }
    if (v.contains("onsetFrames") && v["onsetFrames"].is_number_integer()) {
        out.onsetFrames = v["onsetFrames"].get<int>();
    }
    if (v.contains("hangoverFrames") && v["hangoverFrames"].is_number_integer()) {
        out.hangoverFrames = v["hangoverFrames"].get<int>();
    }
    if (v.contains("maxUtteranceMs") && v["maxUtteranceMs"].is_number_integer()) {
        out.maxUtteranceMs = v["maxUtteranceMs"].get<int>();
    }
}

}  // namespace

BargeInPolicy parseBargeInPolicy(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "drop") {
        return BargeInPolicy::Drop;
    }
    if (lower == "interrupt") {
        return BargeInPolicy::Interrupt;
    }
    return BargeInPolicy::Queue;
}

const char* bargeInPolicyToString(BargeInPolicy policy) {
    switch (policy) {
    case BargeInPolicy::Drop:
        return "drop";
    case BargeInPolicy::Interrupt:
        return "interrupt";
    case BargeInPolicy::Queue:
    default:
        return "queue";
    }
}

DeviceSwitchPolicy parseDeviceSwitchPolicy(const std::string& str) {
    if (toLower(str) == "discard") {
        return DeviceSwitchPolicy::Discard;
    }
    return DeviceSwitchPolicy::Drain;
}

const char* deviceSwitchPolicyToString(DeviceSwitchPolicy policy) {
    switch (policy) {
    case DeviceSwitchPolicy::Discard:
        return "discard";
    case DeviceSwitchPolicy::Drain:
    default:
        return "drain";
    }
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("audio") && j["audio"].is_object()) {
            try {
                parseAudio(j["audio"], outConfig.audio);
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid audio settings, using defaults: {}", e.what());
                }
                outConfig.audio = AppConfig::AudioConfig{};
            }
        }

        if (j.contains("vad") && j["vad"].is_object()) {
            try {
                parseVad(j["vad"], outConfig.vad);
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid vad settings, using defaults: {}", e.what());
                }
                outConfig.vad = AppConfig::VadConfig{};
            }
        }

        if (j.contains("recognizer") && j["recognizer"].is_object()) {
            auto rec = j["recognizer"];
            if (rec.contains("modelPath") && rec["modelPath"].is_string()) {
                outConfig.recognizer.modelPath = rec["modelPath"].get<std::string>();
            }
            if (rec.contains("engineLogLevel") && rec["engineLogLevel"].is_number_integer()) {
                outConfig.recognizer.engineLogLevel = rec["engineLogLevel"].get<int>();
            }
        }

        if (j.contains("synthesizer") && j["synthesizer"].is_object()) {
            auto syn = j["synthesizer"];
            if (syn.contains("voice") && syn["voice"].is_string()) {
                outConfig.synthesizer.voice = syn["voice"].get<std::string>();
            }
            if (syn.contains("speed") && syn["speed"].is_number()) {
                outConfig.synthesizer.speed = syn["speed"].get<float>();
            }
            if (syn.contains("voicesDir") && syn["voicesDir"].is_string()) {
                outConfig.synthesizer.voicesDir = syn["voicesDir"].get<std::string>();
            }
            if (syn.contains("espeakDataPath") && syn["espeakDataPath"].is_string()) {
                outConfig.synthesizer.espeakDataPath = syn["espeakDataPath"].get<std::string>();
            }
            if (syn.contains("useCuda") && syn["useCuda"].is_boolean()) {
                outConfig.synthesizer.useCuda = syn["useCuda"].get<bool>();
            }
        }

        if (j.contains("pipeline") && j["pipeline"].is_object()) {
            auto pipe = j["pipeline"];
            if (pipe.contains("bargeIn") && pipe["bargeIn"].is_string()) {
                std::string policy = pipe["bargeIn"].get<std::string>();
                outConfig.pipeline.bargeIn = parseBargeInPolicy(policy);
                if (verbose && toLower(policy) != bargeInPolicyToString(outConfig.pipeline.bargeIn)) {
                    LOG_WARN("Config: Unsupported pipeline.bargeIn '{}', falling back to 'queue'",
                             policy);
                }
            }
            if (pipe.contains("statusIntervalMs") && pipe["statusIntervalMs"].is_number_integer()) {
                outConfig.pipeline.statusIntervalMs = pipe["statusIntervalMs"].get<int>();
            }
        }

        if (j.contains("control") && j["control"].is_object()) {
            auto ctl = j["control"];
            if (ctl.contains("enabled") && ctl["enabled"].is_boolean()) {
                outConfig.control.enabled = ctl["enabled"].get<bool>();
            }
            if (ctl.contains("endpoint") && ctl["endpoint"].is_string()) {
                outConfig.control.endpoint = ctl["endpoint"].get<std::string>();
            }
            if (ctl.contains("pubEndpoint") && ctl["pubEndpoint"].is_string()) {
                outConfig.control.pubEndpoint = ctl["pubEndpoint"].get<std::string>();
            }
            if (ctl.contains("headless") && ctl["headless"].is_boolean()) {
                outConfig.control.headless = ctl["headless"].get<bool>();
            }
        }

        // Sanitize after parsing
        clampWithWarning(outConfig.audio.sampleRate, 8000u, 48000u, "audio.sampleRate", verbose);
        clampWithWarning(outConfig.audio.blockFrames, 80u, 4800u, "audio.blockFrames", verbose);
        clampWithWarning(outConfig.audio.frameQueueCapacity, 2u, 4096u,
                         "audio.frameQueueCapacity", verbose);
        clampWithWarning(outConfig.audio.playbackPeriodFrames, 64u, 16384u,
                         "audio.playbackPeriodFrames", verbose);
        clampWithWarning(outConfig.audio.playbackPeriods, 2u, 16u, "audio.playbackPeriods",
                         verbose);
        clampWithWarning(outConfig.vad.threshold, 0.0001f, 1.0f, "vad.threshold", verbose);
        clampWithWarning(outConfig.vad.smoothing, 0.01f, 1.0f, "vad.smoothing", verbose);
        clampWithWarning(outConfig.vad.onsetFrames, 1, 100, "vad.onsetFrames", verbose);
        clampWithWarning(outConfig.vad.hangoverFrames, 1, 500, "vad.hangoverFrames", verbose);
        clampWithWarning(outConfig.vad.maxUtteranceMs, 500, 120000, "vad.maxUtteranceMs",
                         verbose);
        clampWithWarning(outConfig.synthesizer.speed, kMinSpeed, kMaxSpeed, "synthesizer.speed",
                         verbose);
        clampWithWarning(outConfig.pipeline.statusIntervalMs, 50, 10000,
                         "pipeline.statusIntervalMs", verbose);

        if (verbose) {
            std::cout << "Config: Loaded from " << std::filesystem::absolute(configPath) << '\n';
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

bool saveAppConfig(const std::filesystem::path& configPath, const AppConfig& config) {
    nlohmann::json j = nlohmann::json::object();

    // Preserve sections this struct does not own (logging)
    {
        std::ifstream existing(configPath);
        if (existing.is_open()) {
            try {
                existing >> j;
                if (!j.is_object()) {
                    j = nlohmann::json::object();
                }
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN("Config: Existing {} is not valid JSON, overwriting: {}",
                         configPath.string(), e.what());
                j = nlohmann::json::object();
            }
        }
    }

    j["audio"] = {
        {"sampleRate", config.audio.sampleRate},
        {"blockFrames", config.audio.blockFrames},
        {"inputDevice", config.audio.inputDevice},
        {"outputDevice", config.audio.outputDevice},
        {"preferVirtualCable", config.audio.preferVirtualCable},
        {"frameQueueCapacity", config.audio.frameQueueCapacity},
        {"playbackPeriodFrames", config.audio.playbackPeriodFrames},
        {"playbackPeriods", config.audio.playbackPeriods},
        {"switchPolicy", deviceSwitchPolicyToString(config.audio.switchPolicy)},
    };
    j["vad"] = {
        {"threshold", config.vad.threshold},
        {"smoothing", config.vad.smoothing},
        {"onsetFrames", config.vad.onsetFrames},
        {"hangoverFrames", config.vad.hangoverFrames},
        {"maxUtteranceMs", config.vad.maxUtteranceMs},
    };
    j["recognizer"] = {
        {"modelPath", config.recognizer.modelPath},
        {"engineLogLevel", config.recognizer.engineLogLevel},
    };
    j["synthesizer"] = {
        {"voice", config.synthesizer.voice},
        {"speed", config.synthesizer.speed},
        {"voicesDir", config.synthesizer.voicesDir},
        {"espeakDataPath", config.synthesizer.espeakDataPath},
        {"useCuda", config.synthesizer.useCuda},
    };
    j["pipeline"] = {
        {"bargeIn", bargeInPolicyToString(config.pipeline.bargeIn)},
        {"statusIntervalMs", config.pipeline.statusIntervalMs},
    };
    j["control"] = {
        {"enabled", config.control.enabled},
        {"endpoint", config.control.endpoint},
        {"pubEndpoint", config.control.pubEndpoint},
        {"headless", config.control.headless},
    };

    std::ofstream out(configPath);
    if (!out.is_open()) {
        LOG_ERROR("Config: Cannot write {}", configPath.string());
        return false;
    }
    out << j.dump(4) << '\n';
    if (!out.good()) {
        LOG_ERROR("Config: Write to {} failed", configPath.string());
        return false;
    }
    LOG_INFO("Config: Saved to {}", configPath.string());
    return true;
}

}  // namespace voice_replacer
