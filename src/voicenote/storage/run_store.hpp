#pragma once

#include "errors.hpp"
#include "run_state.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

struct NoteRecord {
    int64_t id = 0;
    int64_t recording_id = 0;
    std::string path;
    std::string format;
    int64_t size_bytes = 0;
    int64_t failed_segments = 0;
    std::string created_at;
};

// Persistence collaborator of the pipeline. Every failure is a Persistence error.
class RunStore {
public:
    virtual ~RunStore() = default;

    virtual std::expected<void, Error> set_status(int64_t recording_id, RunStatus status) = 0;
    virtual std::expected<void, Error> set_duration(int64_t recording_id, double duration_s) = 0;

    // Writes `text` durably and records a note row referencing the recording.
    virtual std::expected<NoteRecord, Error> save_note(int64_t recording_id, const std::string& text,
                                                       const std::string& format,
                                                       size_t failed_segments) = 0;
};
