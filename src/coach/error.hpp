#pragma once

#include <string>
#include <string_view>

enum class ErrorCode {
    DeviceUnavailable,
    InvalidStateTransition,
    EncodingError,
    UnsupportedFormat,
    AggregationConflict,
    TranscriptionFailed,
    StorageError,
};

struct CoachError {
    ErrorCode code;
    std::string message;
};

inline std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::DeviceUnavailable: return "device unavailable";
        case ErrorCode::InvalidStateTransition: return "invalid state transition";
        case ErrorCode::EncodingError: return "encoding error";
        case ErrorCode::UnsupportedFormat: return "unsupported format";
        case ErrorCode::AggregationConflict: return "aggregation conflict";
        case ErrorCode::TranscriptionFailed: return "transcription failed";
        case ErrorCode::StorageError: return "storage error";
    }
    return "unknown error";
}
