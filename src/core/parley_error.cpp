#include "parley/core/parley_error.h"

namespace parley {

const char* error_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::NotInitialized:
            return "Not initialized";
        case ErrorCode::AlreadyInitialized:
            return "Already initialized";
        case ErrorCode::InitializationFailed:
            return "Initialization failed";
        case ErrorCode::GenerationFailed:
            return "Response generation failed";
        case ErrorCode::InvalidApiKey:
            return "Invalid API key";
        case ErrorCode::RateLimited:
            return "Rate limit exceeded";
        case ErrorCode::ContentFiltered:
            return "Response blocked by content filter";
        case ErrorCode::NetworkError:
            return "Network error";
        case ErrorCode::Timeout:
            return "Operation timed out";
        case ErrorCode::ServerError:
            return "Server error";
        case ErrorCode::InvalidResponse:
            return "Invalid response";
        case ErrorCode::InvalidState:
            return "Invalid state";
        case ErrorCode::AlreadyDisposed:
            return "Already disposed";
        case ErrorCode::ShutdownFailed:
            return "Shutdown failed";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::ConfigParseFailed:
            return "Failed to parse configuration";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::CaptureFailed:
            return "Audio capture failed";
        case ErrorCode::TranscriptionFailed:
            return "Transcription failed";
        case ErrorCode::SpeechFailed:
            return "Speech synthesis failed";
        case ErrorCode::BufferOverflowRecovered:
            return "Audio buffer truncated";
        case ErrorCode::DeviceNotFound:
            return "Audio device not found";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::NotSupported:
            return "Not supported";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

// ------------------------------------------------------------
// Category from code range
// ------------------------------------------------------------
const char* error_category(ErrorCode code) {
    const int32_t value = static_cast<int32_t>(code);
    if (value == 0) return "Success";
    if (value >= -109 && value <= -100) return "Initialization";
    if (value >= -149 && value <= -130) return "Generation";
    if (value >= -179 && value <= -150) return "Network";
    if (value >= -249 && value <= -230) return "ComponentState";
    if (value >= -279 && value <= -250) return "Validation";
    if (value >= -299 && value <= -280) return "Audio";
    if (value >= -899 && value <= -800) return "Other";
    return "Unknown";
}

ErrorInfo make_error_info(ErrorCode code, const std::string& detail) {
    ErrorInfo info;
    info.code = code;
    info.category = error_category(code);
    info.message = error_message(code);
    if (!detail.empty()) {
        info.message += ": " + detail;
    }
    return info;
}

}  // namespace parley
