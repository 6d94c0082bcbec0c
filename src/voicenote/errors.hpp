#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    Probe,
    Segmentation,
    TranscriptionTransient,
    TranscriptionPermanent,
    Persistence,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

inline std::string_view stage_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Probe: return "probe";
        case ErrorKind::Segmentation: return "segmentation";
        case ErrorKind::TranscriptionTransient:
        case ErrorKind::TranscriptionPermanent: return "transcription";
        case ErrorKind::Persistence: return "persistence";
    }
    return "unknown";
}

inline bool is_retryable(const Error& e) {
    return e.kind == ErrorKind::TranscriptionTransient;
}
