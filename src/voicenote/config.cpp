#include "config.hpp"

#include "log.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        logging::warn("config", "could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("asr")) {
            auto& a = j["asr"];
            if (a.contains("url")) cfg.asr.url = a["url"].get<std::string>();
            if (a.contains("api_format")) cfg.asr.api_format = a["api_format"].get<std::string>();
            if (a.contains("model")) cfg.asr.model = a["model"].get<std::string>();
            if (a.contains("api_key")) cfg.asr.api_key = a["api_key"].get<std::string>();
            if (a.contains("language")) cfg.asr.language = a["language"].get<std::string>();
            if (a.contains("prompt")) cfg.asr.prompt = a["prompt"].get<std::string>();
            if (a.contains("request_timeout_s")) cfg.asr.request_timeout_s = a["request_timeout_s"].get<uint32_t>();
            if (a.contains("connect_timeout_s")) cfg.asr.connect_timeout_s = a["connect_timeout_s"].get<uint32_t>();
        }

        if (j.contains("media")) {
            auto& m = j["media"];
            if (m.contains("ffmpeg")) cfg.media.ffmpeg = m["ffmpeg"].get<std::string>();
            if (m.contains("ffprobe")) cfg.media.ffprobe = m["ffprobe"].get<std::string>();
            if (m.contains("segment_format")) cfg.media.segment_format = m["segment_format"].get<std::string>();
            if (m.contains("sample_rate")) cfg.media.sample_rate = m["sample_rate"].get<uint32_t>();
            if (m.contains("probe_timeout_s")) cfg.media.probe_timeout_s = m["probe_timeout_s"].get<uint32_t>();
            if (m.contains("extract_timeout_s")) cfg.media.extract_timeout_s = m["extract_timeout_s"].get<uint32_t>();
        }

        if (j.contains("pipeline")) {
            auto& p = j["pipeline"];
            if (p.contains("segment_seconds")) cfg.pipeline.segment_seconds = p["segment_seconds"].get<double>();
            if (p.contains("max_concurrent")) cfg.pipeline.max_concurrent = p["max_concurrent"].get<uint32_t>();
            if (p.contains("max_attempts")) cfg.pipeline.max_attempts = p["max_attempts"].get<uint32_t>();
            if (p.contains("backoff_base_ms")) cfg.pipeline.backoff_base_ms = p["backoff_base_ms"].get<uint32_t>();
            if (p.contains("backoff_max_ms")) cfg.pipeline.backoff_max_ms = p["backoff_max_ms"].get<uint32_t>();
            if (p.contains("fail_when_all_segments_fail"))
                cfg.pipeline.fail_when_all_segments_fail = p["fail_when_all_segments_fail"].get<bool>();
            if (p.contains("note_format")) cfg.pipeline.note_format = p["note_format"].get<std::string>();
            if (p.contains("scratch_dir")) cfg.pipeline.scratch_dir = p["scratch_dir"].get<std::string>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("data_dir")) cfg.storage.data_dir = s["data_dir"].get<std::string>();
        }

    } catch (const json::exception& e) {
        logging::warn("config", "parse error in {}: {}", path, e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    if (const char* v = std::getenv("OPENAI_API_KEY"); v && *v) asr.api_key = v;
    if (const char* v = std::getenv("OPENAI_BASE_URL"); v && *v) asr.url = v;
    if (const char* v = std::getenv("ASR_MODEL"); v && *v) asr.model = v;

    if (const char* v = std::getenv("SEGMENT_SECONDS"); v && *v) {
        std::string_view s(v);
        double seconds = 0.0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), seconds);
        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            pipeline.segment_seconds = seconds;
        } else {
            logging::warn("config", "ignoring invalid SEGMENT_SECONDS={}", s);
        }
    }
}

void Config::resolve_paths() {
    if (storage.data_dir.empty()) {
        storage.data_dir = platform::data_dir();
        if (storage.data_dir.empty()) storage.data_dir = "/tmp/voicenote/data";
    }
    if (pipeline.scratch_dir.empty()) {
        pipeline.scratch_dir = platform::scratch_dir();
    }
}

std::expected<void, std::string> Config::validate() const {
    if (!(pipeline.segment_seconds > 0.0)) {
        return std::unexpected("pipeline.segment_seconds must be positive");
    }
    if (pipeline.max_concurrent == 0) {
        return std::unexpected("pipeline.max_concurrent must be at least 1");
    }
    if (pipeline.max_attempts == 0) {
        return std::unexpected("pipeline.max_attempts must be at least 1");
    }
    if (pipeline.note_format != "txt" && pipeline.note_format != "md") {
        return std::unexpected("pipeline.note_format must be \"txt\" or \"md\"");
    }
    if (media.segment_format != "mp3" && media.segment_format != "wav" &&
        media.segment_format != "flac") {
        return std::unexpected("media.segment_format must be \"mp3\", \"wav\" or \"flac\"");
    }
    if (media.sample_rate == 0) {
        return std::unexpected("media.sample_rate must be positive");
    }
    if (asr.api_format != "openai" && asr.api_format != "whisper.cpp") {
        return std::unexpected("asr.api_format must be \"openai\" or \"whisper.cpp\"");
    }
    if (asr.request_timeout_s == 0) {
        return std::unexpected("asr.request_timeout_s must be positive");
    }
    if (static_cast<uint64_t>(asr.request_timeout_s) * 1000 >= pipeline.backoff_max_ms) {
        return std::unexpected(std::format(
            "asr.request_timeout_s ({}s) must be shorter than pipeline.backoff_max_ms ({}ms)",
            asr.request_timeout_s, pipeline.backoff_max_ms));
    }
    return {};
}
