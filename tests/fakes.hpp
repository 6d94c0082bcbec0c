#pragma once

#include "asr/backend.hpp"
#include "media/duration_prober.hpp"
#include "media/segmenter.hpp"
#include "storage/run_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// RAII temp directory that is removed with its contents.
struct TmpDir {
    std::filesystem::path path;

    explicit TmpDir(const std::string& prefix = "vn_test_") {
        std::string tmpl = (std::filesystem::temp_directory_path() / (prefix + "XXXXXX")).string();
        if (::mkdtemp(tmpl.data())) path = tmpl;
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    size_t entry_count() const {
        size_t n = 0;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(path, ec);
             it != std::filesystem::recursive_directory_iterator(); ++it) {
            ++n;
        }
        return n;
    }
};

// Sets (or, with nullptr, unsets) an environment variable and restores the
// previous value on destruction.
struct EnvGuard {
    std::string name;
    std::optional<std::string> saved;

    EnvGuard(std::string n, const char* value) : name(std::move(n)) {
        if (const char* old = std::getenv(name.c_str())) saved = old;
        if (value) ::setenv(name.c_str(), value, 1);
        else ::unsetenv(name.c_str());
    }
    ~EnvGuard() {
        if (saved) ::setenv(name.c_str(), saved->c_str(), 1);
        else ::unsetenv(name.c_str());
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;
};

inline void write_file(const std::filesystem::path& p, const std::string& content) {
    std::ofstream f(p, std::ios::binary);
    f << content;
}

class FakeProber : public DurationProber {
public:
    explicit FakeProber(double duration_s) : duration_s_(duration_s) {}

    std::expected<AudioInfo, Error> probe(const std::filesystem::path&) override {
        ++calls;
        if (duration_s_ <= 0.0) {
            return std::unexpected(Error{ErrorKind::Probe, "invalid duration 0"});
        }
        return AudioInfo{.duration_s = duration_s_, .container = "wav", .codec = "pcm_s16le"};
    }

    int calls = 0;

private:
    double duration_s_;
};

// Writes a small placeholder file per segment; fails on request.
class FakeExtractor : public SegmentExtractor {
public:
    std::expected<void, std::string> extract(const std::filesystem::path&,
                                             const SegmentRange& range,
                                             const std::filesystem::path& out) override {
        ranges.push_back(range);
        if (fail_at && *fail_at == range.index) {
            write_file(out, "partial");
            return std::unexpected("encoder crashed");
        }
        write_file(out, "segment " + std::to_string(range.index));
        return {};
    }

    std::string extension() const override { return "wav"; }

    std::optional<size_t> fail_at;
    std::vector<SegmentRange> ranges;
};

// Backend answering per segment index. Segments without a script succeed with
// "text <index>". Tracks concurrency and attempts per segment.
class ScriptedBackend : public AsrBackend {
public:
    using Script = std::function<std::expected<std::string, Error>(size_t index, int attempt)>;

    std::expected<std::string, Error> transcribe(const Segment& segment,
                                                 const std::string& prompt) override {
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}

        int attempt;
        {
            std::lock_guard lock(mutex);
            attempt = ++attempts[segment.index];
            prompts.push_back(prompt);
        }

        if (call_delay.count() > 0) std::this_thread::sleep_for(call_delay);

        std::expected<std::string, Error> result = "text " + std::to_string(segment.index);
        if (script) result = script(segment.index, attempt);

        --in_flight;
        return result;
    }

    int attempts_for(size_t index) {
        std::lock_guard lock(mutex);
        return attempts[index];
    }

    Script script;
    std::chrono::milliseconds call_delay{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::mutex mutex;
    std::map<size_t, int> attempts;
    std::vector<std::string> prompts;
};

inline std::expected<std::string, Error> always_transient(size_t, int) {
    return std::unexpected(Error{ErrorKind::TranscriptionTransient, "503 service unavailable"});
}

// In-memory RunStore recording every status write.
class FakeRunStore : public RunStore {
public:
    std::expected<void, Error> set_status(int64_t, RunStatus status) override {
        if (fail_status && *fail_status == status) {
            return std::unexpected(Error{ErrorKind::Persistence, "database is locked"});
        }
        statuses.push_back(status);
        return {};
    }

    std::expected<void, Error> set_duration(int64_t, double duration_s) override {
        duration = duration_s;
        return {};
    }

    std::expected<NoteRecord, Error> save_note(int64_t recording_id, const std::string& text,
                                               const std::string& format,
                                               size_t failed_segments) override {
        if (fail_note) {
            return std::unexpected(Error{ErrorKind::Persistence, "disk full"});
        }
        note_text = text;
        ++notes_saved;
        return NoteRecord{
            .id = notes_saved,
            .recording_id = recording_id,
            .path = "/notes/note.txt",
            .format = format,
            .size_bytes = static_cast<int64_t>(text.size()),
            .failed_segments = static_cast<int64_t>(failed_segments),
        };
    }

    std::vector<RunStatus> statuses;
    std::optional<RunStatus> fail_status;
    bool fail_note = false;
    double duration = 0.0;
    std::string note_text;
    int64_t notes_saved = 0;
};
