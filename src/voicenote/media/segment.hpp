#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

// The uploaded recording a run works on. Never modified by the pipeline.
struct SourceAudio {
    std::filesystem::path path;
    std::string mime_type;
    double duration_s = 0.0;
    std::string container;
    std::string codec;
};

struct SegmentRange {
    size_t index = 0;
    double start_s = 0.0;
    double end_s = 0.0;

    double length() const { return end_s - start_s; }
};

// One re-encoded slice of the source, in merge order by `index`.
struct Segment {
    size_t index = 0;
    double start_s = 0.0;
    double end_s = 0.0;
    std::filesystem::path path;

    double length() const { return end_s - start_s; }
};
