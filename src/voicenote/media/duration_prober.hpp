#pragma once

#include "errors.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

struct AudioInfo {
    double duration_s = 0.0;
    std::string container;
    std::string codec;
};

class DurationProber {
public:
    virtual ~DurationProber() = default;
    virtual std::expected<AudioInfo, Error> probe(const std::filesystem::path& path) = 0;
};

class FfprobeProber : public DurationProber {
public:
    explicit FfprobeProber(std::string ffprobe = "ffprobe",
                           std::chrono::milliseconds timeout = std::chrono::seconds(10));

    std::expected<AudioInfo, Error> probe(const std::filesystem::path& path) override;

    // Parses `ffprobe -of json` output holding format.duration, format.format_name
    // and the first audio stream's codec_name.
    static std::expected<AudioInfo, Error> parse_output(std::string_view json_text);

private:
    std::string ffprobe_;
    std::chrono::milliseconds timeout_;
};

struct ToolVersions {
    std::string ffmpeg;
    std::string ffprobe;
};

// Runs `<tool> -version` for both tools; returns the first line of each.
std::expected<ToolVersions, std::string> verify_tools(const std::string& ffmpeg,
                                                      const std::string& ffprobe);
