#ifndef VOICE_REPLACER_ERROR_CODES_H
#define VOICE_REPLACER_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace voice_replacer {

/**
 * @brief Error codes for the voice replacement pipeline.
 *
 * Categories use the upper nibble (0xF000 mask):
 * - 0x1xxx: Audio devices (ALSA)
 * - 0x2xxx: Model loading
 * - 0x3xxx: Speech recognition
 * - 0x4xxx: Speech synthesis
 * - 0x5xxx: Queues / buffering
 * - 0x6xxx: IPC/ZeroMQ
 * - 0x7xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio devices (0x1000)
    DEVICE_NOT_FOUND = 0x1001,
    DEVICE_OPEN_FAILED = 0x1002,
    DEVICE_ENUMERATION_FAILED = 0x1003,
    DEVICE_FORMAT_NOT_SUPPORTED = 0x1004,
    DEVICE_RATE_NOT_SUPPORTED = 0x1005,
    DEVICE_IO_FAILED = 0x1006,
    DEVICE_XRUN_DETECTED = 0x1007,

    // Model loading (0x2000)
    MODEL_NOT_FOUND = 0x2001,
    MODEL_LOAD_FAILED = 0x2002,
    MODEL_ENGINE_UNAVAILABLE = 0x2003,

    // Recognition (0x3000)
    RECOGNITION_FAILED = 0x3001,
    RECOGNITION_MODEL_UNAVAILABLE = 0x3002,
    RECOGNITION_INVALID_AUDIO = 0x3003,

    // Synthesis (0x4000)
    SYNTHESIS_FAILED = 0x4001,
    SYNTHESIS_UNKNOWN_VOICE = 0x4002,
    SYNTHESIS_INVALID_SPEED = 0x4003,

    // Queues (0x5000)
    QUEUE_OVERFLOW = 0x5001,
    QUEUE_CLOSED = 0x5002,

    // IPC/ZeroMQ (0x6000)
    IPC_CONNECTION_FAILED = 0x6001,
    IPC_TIMEOUT = 0x6002,
    IPC_INVALID_COMMAND = 0x6003,
    IPC_INVALID_PARAMS = 0x6004,
    IPC_PROTOCOL_ERROR = 0x6005,

    // Validation (0x7000)
    VALIDATION_INVALID_CONFIG = 0x7001,
    VALIDATION_FILE_NOT_FOUND = 0x7002,
    VALIDATION_INVALID_STATE = 0x7003,

    // Internal (0xF000)
    INTERNAL_WORKER_FAULT = 0xF001,
    INTERNAL_UNKNOWN = 0xF0FF,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "DEVICE_OPEN_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "device"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x1002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isDeviceError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isModelError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isRecognitionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isSynthesisError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isQueueError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x6000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x7000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Whether the pipeline keeps running after this error.
 *
 * Everything except internal worker faults is recovered by returning to
 * Listening. Model errors are fatal only while initializing, which the
 * controller handles separately.
 */
constexpr bool isRecoverable(ErrorCode code) {
    return !isInternalError(code);
}

}  // namespace voice_replacer

#endif  // VOICE_REPLACER_ERROR_CODES_H
