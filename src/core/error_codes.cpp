#include "voice_replacer/core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace voice_replacer {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Audio devices
    {ErrorCode::DEVICE_NOT_FOUND, "DEVICE_NOT_FOUND"},
    {ErrorCode::DEVICE_OPEN_FAILED, "DEVICE_OPEN_FAILED"},
    {ErrorCode::DEVICE_ENUMERATION_FAILED, "DEVICE_ENUMERATION_FAILED"},
    {ErrorCode::DEVICE_FORMAT_NOT_SUPPORTED, "DEVICE_FORMAT_NOT_SUPPORTED"},
    {ErrorCode::DEVICE_RATE_NOT_SUPPORTED, "DEVICE_RATE_NOT_SUPPORTED"},
    {ErrorCode::DEVICE_IO_FAILED, "DEVICE_IO_FAILED"},
    {ErrorCode::DEVICE_XRUN_DETECTED, "DEVICE_XRUN_DETECTED"},

    // Model loading
    {ErrorCode::MODEL_NOT_FOUND, "MODEL_NOT_FOUND"},
    {ErrorCode::MODEL_LOAD_FAILED, "MODEL_LOAD_FAILED"},
    {ErrorCode::MODEL_ENGINE_UNAVAILABLE, "MODEL_ENGINE_UNAVAILABLE"},

    // Recognition
    {ErrorCode::RECOGNITION_FAILED, "RECOGNITION_FAILED"},
    {ErrorCode::RECOGNITION_MODEL_UNAVAILABLE, "RECOGNITION_MODEL_UNAVAILABLE"},
    {ErrorCode::RECOGNITION_INVALID_AUDIO, "RECOGNITION_INVALID_AUDIO"},

    // Synthesis
    {ErrorCode::SYNTHESIS_FAILED, "SYNTHESIS_FAILED"},
    {ErrorCode::SYNTHESIS_UNKNOWN_VOICE, "SYNTHESIS_UNKNOWN_VOICE"},
    {ErrorCode::SYNTHESIS_INVALID_SPEED, "SYNTHESIS_INVALID_SPEED"},

    // Queues
    {ErrorCode::QUEUE_OVERFLOW, "QUEUE_OVERFLOW"},
    {ErrorCode::QUEUE_CLOSED, "QUEUE_CLOSED"},

    // IPC/ZeroMQ
    {ErrorCode::IPC_CONNECTION_FAILED, "IPC_CONNECTION_FAILED"},
    {ErrorCode::IPC_TIMEOUT, "IPC_TIMEOUT"},
    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_INVALID_PARAMS, "IPC_INVALID_PARAMS"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},
    {ErrorCode::VALIDATION_INVALID_STATE, "VALIDATION_INVALID_STATE"},

    // Internal
    {ErrorCode::INTERNAL_WORKER_FAULT, "INTERNAL_WORKER_FAULT"},
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isDeviceError(code)) {
        return "device";
    }
    if (isModelError(code)) {
        return "model";
    }
    if (isRecognitionError(code)) {
        return "recognition";
    }
    if (isSynthesisError(code)) {
        return "synthesis";
    }
    if (isQueueError(code)) {
        return "queue";
    }
    if (isIpcError(code)) {
        return "ipc_zeromq";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    // Reverse lookup built once from the forward table
    static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
        std::unordered_map<std::string, ErrorCode> map;
        for (const auto& entry : kErrorCodeStrings) {
            map.emplace(entry.second, entry.first);
        }
        return map;
    }();

    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace voice_replacer
