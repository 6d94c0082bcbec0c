#include "asr/http_backend.hpp"
#include "config.hpp"
#include "log.hpp"
#include "media/duration_prober.hpp"
#include "media/mime_type.hpp"
#include "media/segmenter.hpp"
#include "pipeline.hpp"
#include "storage/recording_store.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <print>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  process <audio> [--mime TYPE] [--name NAME]  Import and transcribe a recording");
    std::println(stderr, "  list [--limit N]                             Show recent recordings");
    std::println(stderr, "  show <id>                                    Show a recording and its note");
    std::println(stderr, "  check                                        Verify ffmpeg and ffprobe");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -h, --help          Show this help");
}

static bool open_store(RecordingStore& store, const Config& config) {
    if (!store.open(config.storage.db_path(), config.storage.media_dir())) {
        std::println(stderr, "Failed to open store at {}", config.storage.db_path());
        return false;
    }
    return true;
}

static int cmd_process(const Config& config, const std::vector<std::string>& args) {
    std::string input;
    std::string mime;
    std::string name;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--mime" && i + 1 < args.size()) {
            mime = args[++i];
        } else if (args[i] == "--name" && i + 1 < args.size()) {
            name = args[++i];
        } else if (input.empty()) {
            input = args[i];
        }
    }
    if (input.empty()) {
        std::println(stderr, "process: missing audio file");
        return 2;
    }
    if (mime.empty()) mime = guess_mime_type(input);

    RecordingStore store;
    if (!open_store(store, config)) return 1;

    auto recording = store.import_recording(input, name, mime);
    if (!recording) {
        std::println(stderr, "process: {}", recording.error().message);
        return 1;
    }

    FfprobeProber prober(config.media.ffprobe, std::chrono::seconds(config.media.probe_timeout_s));
    FfmpegExtractor extractor(config.media.ffmpeg, config.media.segment_format,
                              config.media.sample_rate,
                              std::chrono::seconds(config.media.extract_timeout_s));
    HttpAsrBackend backend(config.asr);
    Pipeline pipeline(config, prober, extractor, backend, store);

    SourceAudio source{
        .path = recording->path,
        .mime_type = recording->mime_type,
    };
    auto report = pipeline.run(recording->id, source);

    if (report.status != RunStatus::Done) {
        std::println(stderr, "Recording {}: processing error", recording->id);
        return 1;
    }

    std::println("Recording {}: {}", recording->id, to_string(report.status));
    std::println("  duration:  {:.1f}s", report.source.duration_s);
    std::println("  segments:  {} ({} failed)", report.segments.size(), report.failed_segments);
    if (report.note) {
        std::println("  note:      {} ({} bytes)", report.note->path, report.note->size_bytes);
    }
    return 0;
}

static int cmd_list(const Config& config, const std::vector<std::string>& args) {
    int limit = 10;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--limit" && i + 1 < args.size()) {
            limit = std::atoi(args[++i].c_str());
        }
    }

    RecordingStore store;
    if (!open_store(store, config)) return 1;

    auto records = store.recent(limit);
    if (records.empty()) {
        std::println("No recordings.");
        return 0;
    }
    for (const auto& r : records) {
        std::println("{:>5}  {:<10}  {:>7.1f}s  {}  {}",
                     r.id, to_string(r.status), r.duration_s, r.created_at, r.original_name);
    }
    return 0;
}

static int cmd_show(const Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::println(stderr, "show: missing recording id");
        return 2;
    }
    int64_t id = std::atoll(args[0].c_str());

    RecordingStore store;
    if (!open_store(store, config)) return 1;

    auto r = store.find(id);
    if (!r) {
        std::println(stderr, "No recording with id {}", id);
        return 1;
    }

    std::println("Recording {}", r->id);
    std::println("  name:      {}", r->original_name);
    std::println("  file:      {}", r->path);
    std::println("  mime:      {}", r->mime_type);
    std::println("  size:      {} bytes", r->size_bytes);
    std::println("  duration:  {:.1f}s", r->duration_s);
    std::println("  status:    {}", to_string(r->status));
    std::println("  created:   {}", r->created_at);

    auto notes = store.notes_for(id);
    for (const auto& n : notes) {
        std::println("  note {}:    {} ({} bytes, {} failed segments)",
                     n.id, n.path, n.size_bytes, n.failed_segments);
    }

    if (!notes.empty()) {
        std::ifstream f(notes.front().path, std::ios::binary);
        if (!f.is_open()) {
            std::println(stderr, "Could not open {}", notes.front().path);
            return 1;
        }
        std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        std::println("");
        std::println("{}", text);
    }
    return 0;
}

static int cmd_check(const Config& config) {
    auto versions = verify_tools(config.media.ffmpeg, config.media.ffprobe);
    if (!versions) {
        std::println(stderr, "{}", versions.error());
        return 1;
    }
    std::println("{}", versions->ffmpeg);
    std::println("{}", versions->ffprobe);
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!command.empty()) {
            args.push_back(arg);
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return 1;
    }

    logging::set_verbose(verbose);

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    config.apply_env();
    config.resolve_paths();

    if (auto valid = config.validate(); !valid) {
        std::println(stderr, "Invalid configuration: {}", valid.error());
        return 1;
    }

    if (command == "process") return cmd_process(config, args);
    if (command == "list") return cmd_list(config, args);
    if (command == "show") return cmd_show(config, args);
    if (command == "check") return cmd_check(config);

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
