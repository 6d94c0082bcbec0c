#pragma once

#include "errors.hpp"
#include "media/segment.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

// Splits [0, duration) into ceil(duration / segment_seconds) contiguous ranges;
// the last one ends exactly at `duration`. Empty for non-positive or
// non-finite inputs.
std::vector<SegmentRange> plan_segments(double duration_s, double segment_seconds);

class SegmentExtractor {
public:
    virtual ~SegmentExtractor() = default;

    // Writes the re-encoded slice `range` of `source` to `out`.
    virtual std::expected<void, std::string> extract(const std::filesystem::path& source,
                                                     const SegmentRange& range,
                                                     const std::filesystem::path& out) = 0;

    // File extension of produced segments, without the dot.
    virtual std::string extension() const = 0;
};

// Mono, fixed sample rate re-encode through ffmpeg.
class FfmpegExtractor : public SegmentExtractor {
public:
    FfmpegExtractor(std::string ffmpeg = "ffmpeg", std::string format = "mp3",
                    uint32_t sample_rate = 16000,
                    std::chrono::milliseconds timeout = std::chrono::seconds(30));

    std::expected<void, std::string> extract(const std::filesystem::path& source,
                                             const SegmentRange& range,
                                             const std::filesystem::path& out) override;

    std::string extension() const override { return format_; }

    std::vector<std::string> build_command(const std::filesystem::path& source,
                                           const SegmentRange& range,
                                           const std::filesystem::path& out) const;

private:
    std::string ffmpeg_;
    std::string format_;
    uint32_t sample_rate_;
    std::chrono::milliseconds timeout_;
};

class Segmenter {
public:
    Segmenter(SegmentExtractor& extractor, double segment_seconds);

    // All-or-nothing: on the first extraction failure every segment file
    // written so far is removed and a Segmentation error is returned.
    std::expected<std::vector<Segment>, Error> split(const std::filesystem::path& source,
                                                     double duration_s,
                                                     const std::filesystem::path& scratch_dir);

    static std::string segment_filename(size_t index, const std::string& extension);

private:
    static void remove_segments(const std::vector<Segment>& segments);

    SegmentExtractor& extractor_;
    double segment_seconds_;
};
