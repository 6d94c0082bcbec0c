#include "media/duration_prober.hpp"

#include "log.hpp"
#include "platform/subprocess.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

FfprobeProber::FfprobeProber(std::string ffprobe, std::chrono::milliseconds timeout)
    : ffprobe_(std::move(ffprobe)), timeout_(timeout) {}

std::expected<AudioInfo, Error> FfprobeProber::probe(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(Error{ErrorKind::Probe, "not a readable file: " + path.string()});
    }

    auto start = std::chrono::steady_clock::now();
    auto proc = platform::run_process({ffprobe_, "-v", "error",
                                       "-select_streams", "a:0",
                                       "-show_entries", "format=duration,format_name:stream=codec_name",
                                       "-of", "json", path.string()},
                                      timeout_);
    if (!proc) {
        return std::unexpected(Error{ErrorKind::Probe, proc.error()});
    }
    if (proc->exit_code == platform::kExecFailedCode) {
        return std::unexpected(Error{ErrorKind::Probe, ffprobe_ + " is not available"});
    }
    if (proc->exit_code != 0) {
        return std::unexpected(Error{ErrorKind::Probe,
            std::format("{} exited with code {}: {}", ffprobe_, proc->exit_code, proc->err)});
    }

    auto info = parse_output(proc->out);
    if (info) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        logging::info("probe", "{}: {:.1f}s {} ({}) in {:.2f}s",
                      path.filename().string(), info->duration_s, info->container, info->codec, elapsed);
    }
    return info;
}

std::expected<AudioInfo, Error> FfprobeProber::parse_output(std::string_view json_text) {
    AudioInfo info;
    try {
        auto j = json::parse(json_text);

        if (!j.contains("format") || !j["format"].contains("duration")) {
            return std::unexpected(Error{ErrorKind::Probe, "no duration in ffprobe output"});
        }
        auto& format = j["format"];

        // ffprobe reports duration as a string ("310.000000", or "N/A").
        auto& d = format["duration"];
        if (d.is_number()) {
            info.duration_s = d.get<double>();
        } else if (d.is_string()) {
            auto s = d.get<std::string>();
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), info.duration_s);
            if (ec != std::errc{} || ptr != s.data() + s.size()) {
                return std::unexpected(Error{ErrorKind::Probe, "unreadable duration: " + s});
            }
        } else {
            return std::unexpected(Error{ErrorKind::Probe, "unreadable duration"});
        }

        if (!std::isfinite(info.duration_s) || info.duration_s <= 0.0) {
            return std::unexpected(Error{ErrorKind::Probe,
                std::format("invalid duration {}", info.duration_s)});
        }

        info.container = format.value("format_name", "");

        if (!j.contains("streams") || j["streams"].empty()) {
            return std::unexpected(Error{ErrorKind::Probe, "no audio stream"});
        }
        info.codec = j["streams"][0].value("codec_name", "");

    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Probe, std::string("ffprobe output: ") + e.what()});
    }
    return info;
}

namespace {

std::expected<std::string, std::string> tool_version(const std::string& tool) {
    auto proc = platform::run_process({tool, "-version"}, std::chrono::seconds(5));
    if (!proc) return std::unexpected(proc.error());
    if (proc->exit_code != 0) {
        return std::unexpected(tool + " not available (exit code " +
                               std::to_string(proc->exit_code) + ")");
    }
    auto eol = proc->out.find('\n');
    return proc->out.substr(0, eol);
}

} // namespace

std::expected<ToolVersions, std::string> verify_tools(const std::string& ffmpeg,
                                                      const std::string& ffprobe) {
    auto ffmpeg_version = tool_version(ffmpeg);
    if (!ffmpeg_version) return std::unexpected(ffmpeg_version.error());

    auto ffprobe_version = tool_version(ffprobe);
    if (!ffprobe_version) return std::unexpected(ffprobe_version.error());

    return ToolVersions{
        .ffmpeg = std::move(*ffmpeg_version),
        .ffprobe = std::move(*ffprobe_version),
    };
}
