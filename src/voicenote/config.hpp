#pragma once

#include <cstdint>
#include <expected>
#include <string>

// Persian classroom guidance prompt sent unchanged with every ASR request.
inline constexpr const char* kDefaultPrompt =
    "متن این فایل صوتی مربوط به یک جلسهٔ آموزشی به زبان فارسی است.\n"
    "لطفاً واژگان را با املای رایج فارسی بنویس و اعداد را به صورت رقم ثبت کن.\n"
    "نام‌های علمی و اصطلاحات را همان‌گونه که ادا می‌شود ثبت کن.\n"
    "از حدس‌زدن یا افزودن کلمات خودداری کن؛ فقط آنچه گفته می‌شود را بنویس.";

struct Config {
    struct Asr {
        std::string url = "https://api.openai.com/v1";
        std::string api_format = "openai"; // "openai" or "whisper.cpp"
        std::string model = "whisper-1";
        std::string api_key;
        std::string language = "fa";
        std::string prompt = kDefaultPrompt;
        uint32_t request_timeout_s = 120;
        uint32_t connect_timeout_s = 10;
    } asr;

    struct Media {
        std::string ffmpeg = "ffmpeg";
        std::string ffprobe = "ffprobe";
        std::string segment_format = "mp3"; // "mp3", "wav" or "flac"
        uint32_t sample_rate = 16000;
        uint32_t probe_timeout_s = 10;
        uint32_t extract_timeout_s = 30;
    } media;

    struct Pipeline {
        double segment_seconds = 150.0;
        uint32_t max_concurrent = 3;
        uint32_t max_attempts = 3;
        uint32_t backoff_base_ms = 1000;
        uint32_t backoff_max_ms = 150000;   // above asr.request_timeout_s
        // When set, a run whose segments all failed ends `failed` instead of
        // persisting an all-sentinel note.
        bool fail_when_all_segments_fail = false;
        std::string note_format = "txt"; // "txt" or "md"
        std::string scratch_dir;         // empty: platform::scratch_dir()
    } pipeline;

    struct Storage {
        std::string data_dir;            // empty: platform::data_dir()

        std::string db_path() const { return data_dir + "/voicenote.db"; }
        std::string media_dir() const { return data_dir + "/media"; }
    } storage;

    static Config load(const std::string& path);
    static Config load_default();

    // Overrides from OPENAI_API_KEY, OPENAI_BASE_URL, ASR_MODEL, SEGMENT_SECONDS.
    void apply_env();

    // Fills empty directory settings from the platform defaults.
    void resolve_paths();

    std::expected<void, std::string> validate() const;
};
