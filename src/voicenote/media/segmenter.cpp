#include "media/segmenter.hpp"

#include "log.hpp"
#include "platform/subprocess.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace fs = std::filesystem;

std::vector<SegmentRange> plan_segments(double duration_s, double segment_seconds) {
    std::vector<SegmentRange> ranges;
    if (!std::isfinite(duration_s) || !std::isfinite(segment_seconds) ||
        duration_s <= 0.0 || segment_seconds <= 0.0) {
        return ranges;
    }

    auto count = static_cast<size_t>(std::ceil(duration_s / segment_seconds));
    // D/S can round just above an integer for fractional S; never emit [D, D).
    while (count > 1 && static_cast<double>(count - 1) * segment_seconds >= duration_s) --count;
    ranges.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        double start = static_cast<double>(i) * segment_seconds;
        double end = (i + 1 == count) ? duration_s
                                      : std::min(static_cast<double>(i + 1) * segment_seconds, duration_s);
        ranges.push_back(SegmentRange{.index = i, .start_s = start, .end_s = end});
    }
    return ranges;
}

FfmpegExtractor::FfmpegExtractor(std::string ffmpeg, std::string format,
                                 uint32_t sample_rate, std::chrono::milliseconds timeout)
    : ffmpeg_(std::move(ffmpeg)), format_(std::move(format)),
      sample_rate_(sample_rate), timeout_(timeout) {}

std::vector<std::string> FfmpegExtractor::build_command(const fs::path& source,
                                                        const SegmentRange& range,
                                                        const fs::path& out) const {
    std::string codec = "libmp3lame";
    if (format_ == "wav") codec = "pcm_s16le";
    else if (format_ == "flac") codec = "flac";

    return {
        ffmpeg_, "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
        "-ss", std::format("{:.3f}", range.start_s),
        "-t", std::format("{:.3f}", range.length()),
        "-i", source.string(),
        "-vn", "-ac", "1", "-ar", std::to_string(sample_rate_),
        "-c:a", codec,
        out.string(),
    };
}

std::expected<void, std::string> FfmpegExtractor::extract(const fs::path& source,
                                                          const SegmentRange& range,
                                                          const fs::path& out) {
    auto cmd = build_command(source, range, out);
    auto proc = platform::run_process(cmd, timeout_);
    if (!proc) {
        return std::unexpected(proc.error());
    }
    if (proc->exit_code == platform::kExecFailedCode) {
        return std::unexpected(ffmpeg_ + " is not available");
    }
    if (proc->exit_code != 0) {
        return std::unexpected(std::format("{} exited with code {}: {}",
                                           ffmpeg_, proc->exit_code, proc->err));
    }

    std::error_code ec;
    auto size = fs::file_size(out, ec);
    if (ec || size == 0) {
        return std::unexpected("no output written to " + out.string());
    }
    return {};
}

Segmenter::Segmenter(SegmentExtractor& extractor, double segment_seconds)
    : extractor_(extractor), segment_seconds_(segment_seconds) {}

std::string Segmenter::segment_filename(size_t index, const std::string& extension) {
    return std::format("segment_{:03}.{}", index, extension);
}

std::expected<std::vector<Segment>, Error> Segmenter::split(const fs::path& source,
                                                            double duration_s,
                                                            const fs::path& scratch_dir) {
    auto ranges = plan_segments(duration_s, segment_seconds_);
    if (ranges.empty()) {
        return std::unexpected(Error{ErrorKind::Segmentation,
            std::format("nothing to split (duration {}s)", duration_s)});
    }

    logging::info("segment", "splitting {:.1f}s into {} segments of <= {}s",
                  duration_s, ranges.size(), segment_seconds_);

    auto split_start = std::chrono::steady_clock::now();
    std::vector<Segment> segments;
    segments.reserve(ranges.size());

    for (const auto& range : ranges) {
        auto out = scratch_dir / segment_filename(range.index, extractor_.extension());
        auto start = std::chrono::steady_clock::now();

        auto res = extractor_.extract(source, range, out);
        if (!res) {
            // The failed extraction may have left a partial file behind.
            std::error_code ec;
            fs::remove(out, ec);
            remove_segments(segments);
            return std::unexpected(Error{ErrorKind::Segmentation,
                std::format("segment {} [{:.1f}s, {:.1f}s): {}",
                            range.index, range.start_s, range.end_s, res.error())});
        }

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        logging::info("segment", "created {}/{}: {:.1f}s-{:.1f}s in {:.2f}s",
                      range.index + 1, ranges.size(), range.start_s, range.end_s, elapsed);

        segments.push_back(Segment{
            .index = range.index,
            .start_s = range.start_s,
            .end_s = range.end_s,
            .path = std::move(out),
        });
    }

    double total = std::chrono::duration<double>(std::chrono::steady_clock::now() - split_start).count();
    logging::info("segment", "split completed in {:.2f}s", total);
    return segments;
}

void Segmenter::remove_segments(const std::vector<Segment>& segments) {
    for (const auto& seg : segments) {
        std::error_code ec;
        fs::remove(seg.path, ec);
        if (ec) {
            logging::warn("segment", "could not remove {}: {}", seg.path.string(), ec.message());
        }
    }
}
