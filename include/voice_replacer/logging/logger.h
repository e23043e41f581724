/**
 * @file logger.h
 * @brief spdlog-backed logging for Voice Replacer
 *
 * Log output goes to stderr (and optionally a rotating file) so that the
 * console presenter owns stdout. Components prefix their messages with a
 * "[Component]" tag.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace voice_replacer {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Install the process-wide logger.
 *
 * A second call only updates level and pattern. The parent directory of
 * filePath is created when missing.
 */
bool initialize(const LogConfig& config = LogConfig{});

// stderr only, no colors; used until the config file has been read
bool initializeEarly();

/**
 * @brief Re-initialize from the "logging" section of a JSON config file.
 *
 * A missing file or section keeps the defaults. overrideLevel (from --debug
 * or --log-level) wins over the file.
 */
bool initializeFromConfig(const std::string& configPath, const LogLevel* overrideLevel = nullptr);

// Fields of a "logging" JSON object; entries of the wrong type are skipped
LogConfig parseLogSection(const nlohmann::json& section, LogConfig base = LogConfig{});

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

// Case-insensitive; "warning", "err", "fatal" and "none" are accepted; unknown -> Info
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace voice_replacer

#include <spdlog/spdlog.h>

#define VOICE_REPLACER_LOG_(spdlogMacro, ...)                     \
    do {                                                          \
        auto vrLogger_ = voice_replacer::logging::getLogger();    \
        if (vrLogger_)                                            \
            spdlogMacro(vrLogger_, __VA_ARGS__);                  \
    } while (0)

#define LOG_TRACE(...) VOICE_REPLACER_LOG_(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) VOICE_REPLACER_LOG_(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) VOICE_REPLACER_LOG_(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) VOICE_REPLACER_LOG_(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) VOICE_REPLACER_LOG_(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) VOICE_REPLACER_LOG_(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

// Rate limit for per-frame paths (capture overflow, PUB send failures)
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)
