#pragma once

#include "errors.hpp"
#include "media/segment.hpp"

#include <expected>
#include <string>

// Remote speech recognition. Implementations must be callable from several
// worker threads at once. Failures carry TranscriptionTransient (worth
// retrying) or TranscriptionPermanent.
class AsrBackend {
public:
    virtual ~AsrBackend() = default;
    virtual std::expected<std::string, Error>
        transcribe(const Segment& segment, const std::string& prompt) = 0;
};
