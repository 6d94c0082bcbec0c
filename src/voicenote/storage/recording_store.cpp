#include "recording_store.hpp"

#include "log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

Error persistence_error(std::string message) {
    return Error{ErrorKind::Persistence, std::move(message)};
}

// Writes `text` to `path` and fsyncs the file and its directory before returning.
std::expected<void, std::string> write_durably(const fs::path& path, const std::string& text) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return std::unexpected(std::strerror(errno));

    const char* p = text.data();
    size_t left = text.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = std::strerror(errno);
            ::close(fd);
            return std::unexpected(err);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::string err = std::strerror(errno);
        ::close(fd);
        return std::unexpected("fsync: " + err);
    }
    if (::close(fd) != 0) return std::unexpected(std::strerror(errno));

    int dir = ::open(path.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir >= 0) {
        if (::fsync(dir) != 0) {
            logging::warn("db", "fsync of {} failed: {}", path.parent_path().string(), std::strerror(errno));
        }
        ::close(dir);
    }
    return {};
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

RecordingStore::RecordingStore() = default;

RecordingStore::~RecordingStore() {
    close();
}

bool RecordingStore::open(const std::string& db_path, const std::string& media_dir) {
    fs::path p(db_path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    media_dir_ = media_dir;
    fs::create_directories(media_dir_, ec);
    if (ec) {
        logging::error("db", "cannot create {}: {}", media_dir, ec.message());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        logging::error("db", "failed to open {}: {}", db_path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    struct Prepared {
        const char* sql;
        sqlite3_stmt** stmt;
    };
    const Prepared statements[] = {
        {"INSERT INTO recordings (path, original_name, mime_type, size_bytes, status) "
         "VALUES (?, ?, ?, ?, 'uploaded')",
         &insert_recording_stmt_},
        {"UPDATE recordings SET status = ?, "
         "updated_at = strftime('%Y-%m-%dT%H:%M:%f','now') WHERE id = ?",
         &update_status_stmt_},
        {"UPDATE recordings SET duration_sec = ?, "
         "updated_at = strftime('%Y-%m-%dT%H:%M:%f','now') WHERE id = ?",
         &update_duration_stmt_},
        {"INSERT INTO notes (recording_id, path, format, size_bytes, failed_segments) "
         "VALUES (?, ?, ?, ?, ?)",
         &insert_note_stmt_},
        {"SELECT id, path, original_name, mime_type, size_bytes, duration_sec, status, "
         "created_at, updated_at FROM recordings WHERE id = ?",
         &find_stmt_},
        {"SELECT id, path, original_name, mime_type, size_bytes, duration_sec, status, "
         "created_at, updated_at FROM recordings ORDER BY id DESC LIMIT ?",
         &recent_stmt_},
        {"SELECT id, recording_id, path, format, size_bytes, failed_segments, created_at "
         "FROM notes WHERE recording_id = ? ORDER BY id DESC",
         &notes_stmt_},
    };

    for (const auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            logging::error("db", "prepare failed: {}", sqlite3_errmsg(db_));
            return false;
        }
    }

    return true;
}

void RecordingStore::close() {
    for (sqlite3_stmt** stmt : {&insert_recording_stmt_, &update_status_stmt_, &update_duration_stmt_,
                                &insert_note_stmt_, &find_stmt_, &recent_stmt_, &notes_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

fs::path RecordingStore::dated_path(const std::string& kind, const std::string& filename) const {
    auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    fs::path dir = media_dir_ / kind / std::format("{:%Y/%m/%d}", today);

    fs::path name(filename);
    fs::path candidate = dir / name;
    std::error_code ec;
    for (int n = 1; fs::exists(candidate, ec); ++n) {
        candidate = dir / std::format("{}_{}{}", name.stem().string(), n, name.extension().string());
    }
    return candidate;
}

std::expected<RecordingRecord, Error> RecordingStore::import_recording(const fs::path& source,
                                                                       const std::string& original_name,
                                                                       const std::string& mime_type) {
    if (!insert_recording_stmt_) return std::unexpected(persistence_error("store is not open"));

    std::error_code ec;
    auto size = fs::file_size(source, ec);
    if (ec) {
        return std::unexpected(persistence_error("cannot read " + source.string() + ": " + ec.message()));
    }

    std::string name = original_name.empty() ? source.filename().string() : original_name;
    auto dest = dated_path("voices", fs::path(name).filename().string());
    fs::create_directories(dest.parent_path(), ec);
    if (!ec) fs::copy_file(source, dest, ec);
    if (ec) {
        return std::unexpected(persistence_error("cannot store " + dest.string() + ": " + ec.message()));
    }

    sqlite3_reset(insert_recording_stmt_);
    sqlite3_bind_text(insert_recording_stmt_, 1, dest.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_recording_stmt_, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_recording_stmt_, 3, mime_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_recording_stmt_, 4, static_cast<sqlite3_int64>(size));

    if (sqlite3_step(insert_recording_stmt_) != SQLITE_DONE) {
        std::string msg = std::string("insert recording failed: ") + sqlite3_errmsg(db_);
        fs::remove(dest, ec);
        return std::unexpected(persistence_error(std::move(msg)));
    }

    int64_t id = sqlite3_last_insert_rowid(db_);
    logging::info("db", "stored recording {}: {} ({} bytes)", id, dest.string(), size);

    auto record = find(id);
    if (!record) return std::unexpected(persistence_error("recording vanished after insert"));
    return *record;
}

std::expected<void, Error> RecordingStore::update_one(sqlite3_stmt* stmt, int64_t recording_id) {
    sqlite3_bind_int64(stmt, 2, recording_id);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return std::unexpected(persistence_error(std::string("update failed: ") + sqlite3_errmsg(db_)));
    }
    if (sqlite3_changes(db_) == 0) {
        return std::unexpected(persistence_error(std::format("no recording with id {}", recording_id)));
    }
    return {};
}

std::expected<void, Error> RecordingStore::set_status(int64_t recording_id, RunStatus status) {
    if (!update_status_stmt_) return std::unexpected(persistence_error("store is not open"));

    sqlite3_reset(update_status_stmt_);
    auto name = to_string(status);
    sqlite3_bind_text(update_status_stmt_, 1, name.data(), static_cast<int>(name.size()), SQLITE_TRANSIENT);
    return update_one(update_status_stmt_, recording_id);
}

std::expected<void, Error> RecordingStore::set_duration(int64_t recording_id, double duration_s) {
    if (!update_duration_stmt_) return std::unexpected(persistence_error("store is not open"));

    sqlite3_reset(update_duration_stmt_);
    sqlite3_bind_double(update_duration_stmt_, 1, duration_s);
    return update_one(update_duration_stmt_, recording_id);
}

std::expected<NoteRecord, Error> RecordingStore::save_note(int64_t recording_id, const std::string& text,
                                                           const std::string& format,
                                                           size_t failed_segments) {
    if (!insert_note_stmt_) return std::unexpected(persistence_error("store is not open"));

    auto recording = find(recording_id);
    if (!recording) {
        return std::unexpected(persistence_error(std::format("no recording with id {}", recording_id)));
    }

    auto stem = fs::path(recording->original_name).stem().string();
    if (stem.empty()) stem = std::format("recording_{}", recording_id);
    auto dest = dated_path("notes", std::format("{}_note.{}", stem, format));

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        return std::unexpected(persistence_error("cannot create " + dest.parent_path().string() +
                                                 ": " + ec.message()));
    }

    if (auto written = write_durably(dest, text); !written) {
        fs::remove(dest, ec);
        return std::unexpected(persistence_error("cannot write " + dest.string() + ": " + written.error()));
    }

    sqlite3_reset(insert_note_stmt_);
    sqlite3_bind_int64(insert_note_stmt_, 1, recording_id);
    sqlite3_bind_text(insert_note_stmt_, 2, dest.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_note_stmt_, 3, format.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_note_stmt_, 4, static_cast<sqlite3_int64>(text.size()));
    sqlite3_bind_int64(insert_note_stmt_, 5, static_cast<sqlite3_int64>(failed_segments));

    if (sqlite3_step(insert_note_stmt_) != SQLITE_DONE) {
        std::string msg = std::string("insert note failed: ") + sqlite3_errmsg(db_);
        fs::remove(dest, ec);
        return std::unexpected(persistence_error(std::move(msg)));
    }

    int64_t note_id = sqlite3_last_insert_rowid(db_);
    logging::info("db", "created note {}: {} ({} bytes)", note_id, dest.string(), text.size());

    auto notes = notes_for(recording_id);
    if (notes.empty() || notes.front().id != note_id) {
        return std::unexpected(persistence_error("note vanished after insert"));
    }
    return notes.front();
}

RecordingRecord RecordingStore::read_recording(sqlite3_stmt* stmt) {
    RecordingRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.path = column_text(stmt, 1);
    r.original_name = column_text(stmt, 2);
    r.mime_type = column_text(stmt, 3);
    r.size_bytes = sqlite3_column_int64(stmt, 4);
    r.duration_s = sqlite3_column_double(stmt, 5);
    r.status = parse_run_status(column_text(stmt, 6)).value_or(RunStatus::Failed);
    r.created_at = column_text(stmt, 7);
    r.updated_at = column_text(stmt, 8);
    return r;
}

std::optional<RecordingRecord> RecordingStore::find(int64_t recording_id) {
    if (!find_stmt_) return std::nullopt;

    sqlite3_reset(find_stmt_);
    sqlite3_bind_int64(find_stmt_, 1, recording_id);
    if (sqlite3_step(find_stmt_) != SQLITE_ROW) return std::nullopt;
    auto record = read_recording(find_stmt_);
    sqlite3_reset(find_stmt_);
    return record;
}

std::vector<RecordingRecord> RecordingStore::recent(int limit) {
    std::vector<RecordingRecord> records;
    if (!recent_stmt_) return records;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        records.push_back(read_recording(recent_stmt_));
    }
    return records;
}

std::vector<NoteRecord> RecordingStore::notes_for(int64_t recording_id) {
    std::vector<NoteRecord> notes;
    if (!notes_stmt_) return notes;

    sqlite3_reset(notes_stmt_);
    sqlite3_bind_int64(notes_stmt_, 1, recording_id);
    while (sqlite3_step(notes_stmt_) == SQLITE_ROW) {
        NoteRecord n;
        n.id = sqlite3_column_int64(notes_stmt_, 0);
        n.recording_id = sqlite3_column_int64(notes_stmt_, 1);
        n.path = column_text(notes_stmt_, 2);
        n.format = column_text(notes_stmt_, 3);
        n.size_bytes = sqlite3_column_int64(notes_stmt_, 4);
        n.failed_segments = sqlite3_column_int64(notes_stmt_, 5);
        n.created_at = column_text(notes_stmt_, 6);
        notes.push_back(std::move(n));
    }
    return notes;
}

bool RecordingStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS recordings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT NOT NULL,
            original_name TEXT NOT NULL,
            mime_type TEXT,
            size_bytes INTEGER NOT NULL,
            duration_sec REAL,
            status TEXT NOT NULL DEFAULT 'uploaded'
                CHECK (status IN ('uploaded', 'processing', 'done', 'failed')),
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now'))
        );
        CREATE TABLE IF NOT EXISTS notes (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            recording_id INTEGER REFERENCES recordings(id) ON DELETE SET NULL,
            path TEXT NOT NULL,
            format TEXT NOT NULL DEFAULT 'txt',
            size_bytes INTEGER NOT NULL,
            failed_segments INTEGER NOT NULL DEFAULT 0,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now'))
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        logging::error("db", "create tables failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
