#pragma once

#include "voice_replacer/core/error_codes.h"

#include <stdexcept>
#include <string>

namespace voice_replacer {

// Base of every error raised by the pipeline stages. Carries an ErrorCode so
// the controller and the control plane can report it without string parsing.
class VoiceReplacerError : public std::runtime_error {
   public:
    VoiceReplacerError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept {
        return code_;
    }

   private:
    ErrorCode code_;
};

// Device open/enumerate/io failure
class DeviceError : public VoiceReplacerError {
   public:
    explicit DeviceError(const std::string& message,
                         ErrorCode code = ErrorCode::DEVICE_OPEN_FAILED)
        : VoiceReplacerError(code, message) {}
};

// Model missing or engine not built in. Fatal only during initialize().
class ModelLoadError : public VoiceReplacerError {
   public:
    explicit ModelLoadError(const std::string& message,
                            ErrorCode code = ErrorCode::MODEL_LOAD_FAILED)
        : VoiceReplacerError(code, message) {}
};

class RecognitionError : public VoiceReplacerError {
   public:
    explicit RecognitionError(const std::string& message,
                              ErrorCode code = ErrorCode::RECOGNITION_FAILED)
        : VoiceReplacerError(code, message) {}
};

class SynthesisError : public VoiceReplacerError {
   public:
    explicit SynthesisError(const std::string& message,
                            ErrorCode code = ErrorCode::SYNTHESIS_FAILED)
        : VoiceReplacerError(code, message) {}
};

// Frame drop. Counted on the capture path; only thrown by callers that
// explicitly ask for strict queue semantics.
class QueueOverflowError : public VoiceReplacerError {
   public:
    explicit QueueOverflowError(const std::string& message)
        : VoiceReplacerError(ErrorCode::QUEUE_OVERFLOW, message) {}
};

}  // namespace voice_replacer
