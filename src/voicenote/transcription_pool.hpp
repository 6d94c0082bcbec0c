#pragma once

#include "asr/backend.hpp"
#include "media/segment.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class OutcomeStatus { Ok, Failed };

struct TranscriptionOutcome {
    size_t index = 0;
    OutcomeStatus status = OutcomeStatus::Failed;
    std::string text;        // set only when status is Ok
    uint32_t attempts = 0;
    std::string error;       // last error when status is Failed
    double elapsed_s = 0.0;

    bool ok() const { return status == OutcomeStatus::Ok; }
};

struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{150000};

    // Wait before the attempt following `attempt` (1-based): base * 2^(attempt-1), capped.
    std::chrono::milliseconds delay_after(uint32_t attempt) const;
};

// Transcribes segments on a fixed set of min(max_concurrent, N) workers that
// claim segment indices from a shared counter, so no more than
// `max_concurrent` backend calls are ever in flight. Each segment is retried
// independently; a segment that runs out of attempts ends Failed without
// affecting the others. run() returns once every segment has an outcome.
class TranscriptionPool {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    TranscriptionPool(AsrBackend& backend, uint32_t max_concurrent, RetryPolicy retry,
                      Sleeper sleeper = {});

    // Outcomes are indexed like `segments`, whatever order they completed in.
    std::vector<TranscriptionOutcome> run(const std::vector<Segment>& segments,
                                          const std::string& prompt);

private:
    TranscriptionOutcome transcribe_with_retry(const Segment& segment, const std::string& prompt);

    AsrBackend& backend_;
    uint32_t max_concurrent_;
    RetryPolicy retry_;
    Sleeper sleeper_;
};
