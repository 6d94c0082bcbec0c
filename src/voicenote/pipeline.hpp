#pragma once

#include "asr/backend.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "media/duration_prober.hpp"
#include "media/segment.hpp"
#include "media/segmenter.hpp"
#include "run_state.hpp"
#include "storage/run_store.hpp"
#include "transcription_pool.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Everything known about one run once it has reached a terminal status.
struct RunReport {
    int64_t recording_id = 0;
    RunStatus status = RunStatus::Uploaded;
    SourceAudio source;
    std::vector<Segment> segments;
    std::vector<TranscriptionOutcome> outcomes;
    std::string text;
    size_t failed_segments = 0;
    std::optional<Error> error;        // set iff status is Failed
    std::optional<NoteRecord> note;    // set iff status is Done

    std::string asr_model;
    std::string asr_base_url;
    double segment_seconds = 0.0;

    double probe_s = 0.0;
    double segment_s = 0.0;
    double transcribe_s = 0.0;
    double total_s = 0.0;
};

nlohmann::json to_json(const RunReport& report);

// Drives one recording through probe -> segment -> transcribe -> merge ->
// persist. Stage failures end the run `failed`; segment transcription
// failures only leave sentinels in the note. The run's scratch directory is
// removed before the terminal status is written.
class Pipeline {
public:
    Pipeline(Config config, DurationProber& prober, SegmentExtractor& extractor,
             AsrBackend& backend, RunStore& store, TranscriptionPool::Sleeper sleeper = {});

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    RunReport run(int64_t recording_id, const SourceAudio& source);

private:
    std::expected<void, Error> execute(RunReport& report, std::filesystem::path& scratch);
    std::expected<std::filesystem::path, Error> make_scratch_dir(int64_t recording_id);
    void cleanup(const std::filesystem::path& scratch);

    Config config_;
    DurationProber& prober_;
    SegmentExtractor& extractor_;
    AsrBackend& backend_;
    RunStore& store_;
    TranscriptionPool::Sleeper sleeper_;
};
