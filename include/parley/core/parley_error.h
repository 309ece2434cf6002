/**
 * @file parley_error.h
 * @brief Parley - Result codes
 *
 * Every fallible operation returns an ErrorCode. Zero is success; failures are
 * negative and grouped into category ranges so hosts can classify them
 * without knowing every code.
 */

#ifndef PARLEY_CORE_ERROR_H
#define PARLEY_CORE_ERROR_H

#include <cstdint>
#include <string>

namespace parley {

enum class ErrorCode : int32_t {
    Success = 0,

    // Initialization (-100 .. -109)
    NotInitialized = -100,
    AlreadyInitialized = -101,
    InitializationFailed = -102,

    // Generation (-130 .. -149)
    GenerationFailed = -130,
    InvalidApiKey = -131,
    RateLimited = -132,
    ContentFiltered = -133,

    // Network (-150 .. -179)
    NetworkError = -150,
    Timeout = -151,
    ServerError = -152,
    InvalidResponse = -153,

    // Component state (-230 .. -249)
    InvalidState = -230,
    AlreadyDisposed = -231,
    ShutdownFailed = -232,

    // Validation (-250 .. -279)
    InvalidArgument = -250,
    ConfigParseFailed = -251,
    FileNotFound = -252,

    // Audio (-280 .. -299)
    CaptureFailed = -280,
    TranscriptionFailed = -281,
    SpeechFailed = -282,
    BufferOverflowRecovered = -283,
    DeviceNotFound = -284,

    // Other (-800 .. -899)
    Cancelled = -800,
    NotSupported = -801,
    Unknown = -899,
};

struct ErrorInfo {
    ErrorCode code = ErrorCode::Success;
    std::string category;
    std::string message;
};

inline bool succeeded(ErrorCode code) { return code == ErrorCode::Success; }
inline bool failed(ErrorCode code) { return code != ErrorCode::Success; }

// Short human-readable description of the code itself
const char* error_message(ErrorCode code);

// Category name derived from the code's range ("Audio", "Network", ...)
const char* error_category(ErrorCode code);

// Builds an ErrorInfo; a non-empty detail is appended to the base message
ErrorInfo make_error_info(ErrorCode code, const std::string& detail = {});

}  // namespace parley

#endif  // PARLEY_CORE_ERROR_H
