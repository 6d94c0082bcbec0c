#include "pipeline.hpp"

#include "log.hpp"
#include "merger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <stdlib.h>

namespace fs = std::filesystem;

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Pipeline::Pipeline(Config config, DurationProber& prober, SegmentExtractor& extractor,
                   AsrBackend& backend, RunStore& store, TranscriptionPool::Sleeper sleeper)
    : config_(std::move(config)), prober_(prober), extractor_(extractor),
      backend_(backend), store_(store), sleeper_(std::move(sleeper)) {}

RunReport Pipeline::run(int64_t recording_id, const SourceAudio& source) {
    auto run_start = std::chrono::steady_clock::now();

    RunReport report;
    report.recording_id = recording_id;
    report.source = source;
    report.asr_model = config_.asr.model;
    report.asr_base_url = config_.asr.url;
    report.segment_seconds = config_.pipeline.segment_seconds;

    logging::info("pipeline", "[start] recording {}: {}", recording_id, source.path.string());

    RunState state;
    state.begin();

    fs::path scratch;
    std::expected<void, Error> result;
    if (auto st = store_.set_status(recording_id, RunStatus::Processing); !st) {
        result = std::unexpected(st.error());
    } else {
        result = execute(report, scratch);
    }

    cleanup(scratch);

    if (result) {
        if (auto st = store_.set_status(recording_id, RunStatus::Done); st) {
            state.complete();
        } else {
            result = std::unexpected(st.error());
        }
    }

    if (!result) {
        state.fail();
        const auto& err = result.error();
        logging::error("pipeline", "recording {} failed in {} stage: {}",
                       recording_id, stage_name(err.kind), err.message);
        if (auto st = store_.set_status(recording_id, RunStatus::Failed); !st) {
            logging::error("pipeline", "could not record failed status for {}: {}",
                           recording_id, st.error().message);
        }
        report.error = err;
        report.note.reset();
    }

    report.status = state.status();
    report.total_s = seconds_since(run_start);

    logging::info("pipeline", "[end] recording {} {} in {:.2f}s ({} segments, {} failed)",
                  recording_id, to_string(report.status), report.total_s,
                  report.segments.size(), report.failed_segments);
    logging::info("pipeline", "report {}", to_json(report).dump());
    return report;
}

std::expected<void, Error> Pipeline::execute(RunReport& report, fs::path& scratch) {
    const auto id = report.recording_id;

    auto stage_start = std::chrono::steady_clock::now();
    auto info = prober_.probe(report.source.path);
    report.probe_s = seconds_since(stage_start);
    if (!info) return std::unexpected(info.error());

    report.source.duration_s = info->duration_s;
    report.source.container = info->container;
    report.source.codec = info->codec;

    if (auto st = store_.set_duration(id, info->duration_s); !st) {
        logging::warn("pipeline", "could not record duration for {}: {}", id, st.error().message);
    }

    auto dir = make_scratch_dir(id);
    if (!dir) return std::unexpected(dir.error());
    scratch = *dir;

    stage_start = std::chrono::steady_clock::now();
    Segmenter segmenter(extractor_, config_.pipeline.segment_seconds);
    auto segments = segmenter.split(report.source.path, info->duration_s, scratch);
    report.segment_s = seconds_since(stage_start);
    if (!segments) return std::unexpected(segments.error());
    report.segments = std::move(*segments);

    stage_start = std::chrono::steady_clock::now();
    RetryPolicy retry{
        .max_attempts = config_.pipeline.max_attempts,
        .base_delay = std::chrono::milliseconds(config_.pipeline.backoff_base_ms),
        .max_delay = std::chrono::milliseconds(config_.pipeline.backoff_max_ms),
    };
    TranscriptionPool pool(backend_, config_.pipeline.max_concurrent, retry, sleeper_);
    report.outcomes = pool.run(report.segments, config_.asr.prompt);
    report.transcribe_s = seconds_since(stage_start);
    logging::info("pipeline", "transcription of {} segments finished in {:.2f}s",
                  report.segments.size(), report.transcribe_s);

    report.failed_segments = count_failed(report.outcomes);
    report.text = merge_transcripts(report.outcomes);

    if (report.failed_segments == report.outcomes.size()) {
        if (config_.pipeline.fail_when_all_segments_fail) {
            return std::unexpected(Error{ErrorKind::TranscriptionPermanent,
                std::format("all {} segments failed", report.outcomes.size())});
        }
        logging::warn("pipeline", "recording {}: all {} segments failed, note holds only placeholders",
                      id, report.outcomes.size());
    } else if (report.failed_segments > 0) {
        logging::warn("pipeline", "recording {}: note contains {} failed segment markers",
                      id, report.failed_segments);
    }

    auto note = store_.save_note(id, report.text, config_.pipeline.note_format, report.failed_segments);
    if (!note) return std::unexpected(note.error());
    report.note = std::move(*note);
    return {};
}

std::expected<fs::path, Error> Pipeline::make_scratch_dir(int64_t recording_id) {
    fs::path root = config_.pipeline.scratch_dir;
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::Segmentation,
            "cannot create scratch root " + root.string() + ": " + ec.message()});
    }

    std::string tmpl = (root / std::format("run_{}_XXXXXX", recording_id)).string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
        return std::unexpected(Error{ErrorKind::Segmentation,
            std::string("mkdtemp failed: ") + std::strerror(errno)});
    }
    return fs::path(tmpl);
}

void Pipeline::cleanup(const fs::path& scratch) {
    if (scratch.empty()) return;

    std::error_code ec;
    auto removed = fs::remove_all(scratch, ec);
    if (ec) {
        logging::warn("pipeline", "cleanup of {} failed: {}", scratch.string(), ec.message());
        return;
    }
    logging::info("pipeline", "removed {} scratch entries under {}", removed, scratch.string());
}

nlohmann::json to_json(const RunReport& report) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& seg : report.segments) {
        nlohmann::json s = {
            {"index", seg.index},
            {"start", seg.start_s},
            {"end", seg.end_s},
        };
        if (seg.index < report.outcomes.size()) {
            const auto& o = report.outcomes[seg.index];
            s["status"] = o.ok() ? "ok" : "failed";
            s["attempts"] = o.attempts;
            s["asr_seconds"] = o.elapsed_s;
            if (!o.ok()) s["error"] = o.error;
        }
        segments.push_back(std::move(s));
    }

    nlohmann::json j = {
        {"recording_id", report.recording_id},
        {"status", std::string(to_string(report.status))},
        {"source", report.source.path.string()},
        {"duration", report.source.duration_s},
        {"container", report.source.container},
        {"codec", report.source.codec},
        {"asr_model", report.asr_model},
        {"asr_base_url", report.asr_base_url},
        {"segment_length", report.segment_seconds},
        {"segments", std::move(segments)},
        {"failed_segments", report.failed_segments},
        {"merged_text_length", report.text.size()},
        {"probe_seconds", report.probe_s},
        {"segment_seconds", report.segment_s},
        {"transcribe_seconds", report.transcribe_s},
        {"total_seconds", report.total_s},
    };
    if (report.error) {
        j["error"] = {
            {"stage", std::string(stage_name(report.error->kind))},
            {"message", report.error->message},
        };
    }
    if (report.note) {
        j["note"] = {
            {"id", report.note->id},
            {"path", report.note->path},
            {"size_bytes", report.note->size_bytes},
        };
    }
    return j;
}
