#pragma once

#include "run_store.hpp"

#include <filesystem>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RecordingRecord {
    int64_t id = 0;
    std::string path;
    std::string original_name;
    std::string mime_type;
    int64_t size_bytes = 0;
    double duration_s = 0.0;   // 0 until probed
    RunStatus status = RunStatus::Uploaded;
    std::string created_at;
    std::string updated_at;
};

// sqlite metadata for recordings and their notes; the audio and note files
// themselves live under `media_dir`.
class RecordingStore : public RunStore {
public:
    RecordingStore();
    ~RecordingStore() override;

    RecordingStore(const RecordingStore&) = delete;
    RecordingStore& operator=(const RecordingStore&) = delete;

    bool open(const std::string& db_path, const std::string& media_dir);
    void close();

    // Copies `source` into media/voices/YYYY/MM/DD/ and inserts an `uploaded` row.
    std::expected<RecordingRecord, Error> import_recording(const std::filesystem::path& source,
                                                           const std::string& original_name,
                                                           const std::string& mime_type);

    std::expected<void, Error> set_status(int64_t recording_id, RunStatus status) override;
    std::expected<void, Error> set_duration(int64_t recording_id, double duration_s) override;
    std::expected<NoteRecord, Error> save_note(int64_t recording_id, const std::string& text,
                                               const std::string& format,
                                               size_t failed_segments) override;

    std::optional<RecordingRecord> find(int64_t recording_id);
    std::vector<RecordingRecord> recent(int limit = 10);
    std::vector<NoteRecord> notes_for(int64_t recording_id);

private:
    bool create_tables();
    std::expected<void, Error> update_one(sqlite3_stmt* stmt, int64_t recording_id);
    static RecordingRecord read_recording(sqlite3_stmt* stmt);

    // <media>/<kind>/YYYY/MM/DD/<filename>, with _N appended to the stem if taken.
    std::filesystem::path dated_path(const std::string& kind, const std::string& filename) const;

    sqlite3* db_ = nullptr;
    std::filesystem::path media_dir_;

    sqlite3_stmt* insert_recording_stmt_ = nullptr;
    sqlite3_stmt* update_status_stmt_ = nullptr;
    sqlite3_stmt* update_duration_stmt_ = nullptr;
    sqlite3_stmt* insert_note_stmt_ = nullptr;
    sqlite3_stmt* find_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* notes_stmt_ = nullptr;
};
