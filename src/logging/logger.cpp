#include "voice_replacer/logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <utility>
#include <vector>

namespace voice_replacer {
namespace logging {

namespace {

constexpr const char* kLoggerName = "voice_replacer";
constexpr size_t kBacktraceMessages = 32;

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    std::string_view name;
};

// Indexed by LogLevel
constexpr std::array<LevelEntry, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
}};

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

const LevelEntry& entryFor(LogLevel level) {
    const auto index = static_cast<size_t>(level);
    return index < kLevels.size() ? kLevels[index] : kLevels[static_cast<size_t>(LogLevel::Info)];
}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    return entryFor(level).spdlogLevel;
}

std::vector<spdlog::sink_ptr> makeSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    const auto level = toSpdlogLevel(config.level);

    if (config.consoleOutput) {
        // stdout belongs to the console presenter
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        console->set_level(level);
        sinks.push_back(std::move(console));
    }

    if (!config.filePath.empty()) {
        const std::filesystem::path path(config.filePath);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                std::cerr << "Cannot create log directory " << path.parent_path() << ": "
                          << ec.message() << std::endl;
            }
        }
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups);
        file->set_level(level);
        sinks.push_back(std::move(file));
    }
    return sinks;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    const auto level = toSpdlogLevel(config.level);

    if (g_initialized.load(std::memory_order_acquire) && g_logger) {
        g_logger->set_level(level);
        g_logger->set_pattern(config.pattern);
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(level);
        }
        return true;
    }

    try {
        auto sinks = makeSinks(config);
        g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        g_logger->set_level(level);
        g_logger->set_pattern(config.pattern);
        g_logger->enable_backtrace(kBacktraceMessages);
        g_logger->flush_on(spdlog::level::err);
        spdlog::set_default_logger(g_logger);
        g_initialized.store(true, std::memory_order_release);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    LOG_DEBUG("[Logging] Initialized at level {}", levelToString(config.level));
    if (!config.filePath.empty()) {
        LOG_INFO("[Logging] Writing {} ({} MB x {} backups)", config.filePath,
                 config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    LogConfig config;
    config.coloredOutput = false;
    return initialize(config);
}

LogConfig parseLogSection(const nlohmann::json& section, LogConfig base) {
    if (!section.is_object()) {
        return base;
    }
    if (section.contains("level") && section["level"].is_string()) {
        base.level = stringToLevel(section["level"].get<std::string>());
    }
    if (section.contains("filePath") && section["filePath"].is_string()) {
        base.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize") && section["maxFileSize"].is_number_unsigned()) {
        base.maxFileSize = std::max<size_t>(section["maxFileSize"].get<size_t>(), 1024);
    }
    if (section.contains("maxBackups") && section["maxBackups"].is_number_unsigned()) {
        base.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput") && section["consoleOutput"].is_boolean()) {
        base.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("coloredOutput") && section["coloredOutput"].is_boolean()) {
        base.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern") && section["pattern"].is_string()) {
        base.pattern = section["pattern"].get<std::string>();
    }
    return base;
}

bool initializeFromConfig(const std::string& configPath, const LogLevel* overrideLevel) {
    LogConfig config;

    std::ifstream file(configPath);
    if (file.is_open()) {
        try {
            nlohmann::json json;
            file >> json;
            if (json.contains("logging")) {
                config = parseLogSection(json["logging"]);
            }
        } catch (const nlohmann::json::exception& ex) {
            // The config loader reports the same file again with more context
            std::cerr << "Ignoring logging section of " << configPath << ": " << ex.what()
                      << std::endl;
        }
    }

    if (overrideLevel) {
        config.level = *overrideLevel;
    }

    // Sinks cannot be swapped on a live logger; rebuild it
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (g_logger) {
            g_logger->flush();
        }
        g_initialized.store(false, std::memory_order_release);
        g_logger.reset();
    }
    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (!logger) {
        return;
    }
    logger->set_level(toSpdlogLevel(level));
    for (auto& sink : logger->sinks()) {
        sink->set_level(toSpdlogLevel(level));
    }
}

LogLevel getLevel() {
    auto logger = getLogger();
    if (!logger) {
        return LogLevel::Info;
    }
    const auto current = logger->level();
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == current) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    if (lower == "fatal") {
        return LogLevel::Critical;
    }
    if (lower == "none") {
        return LogLevel::Off;
    }
    for (const auto& entry : kLevels) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace voice_replacer
