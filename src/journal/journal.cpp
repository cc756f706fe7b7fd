#include <ctime>
#include <stdexcept>

#include "../db/sqlite.hpp"
#include "./journal.hpp"

std::string current_timestamp() {
    std::time_t current_time = std::time(nullptr);
    std::tm time_struct{};
#ifdef _WIN32
    gmtime_s(&time_struct, &current_time);
#else
    gmtime_r(&current_time, &time_struct);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &time_struct);
    return buffer;
}

static std::string column_string(sqlite3_stmt *stmt, int column) {
    const auto ptr = sqlite3_column_text(stmt, column);
    if (ptr == nullptr) {
        return "";
    }
    return std::string(reinterpret_cast<const char *>(ptr));
}

ArchiveJournal::ArchiveJournal(std::shared_ptr<sqlite3> db_, bool reset) : db {db_} {
    if (reset) {
        db_exec(db, std::string("DROP TABLE IF EXISTS ") + ARCHIVED_FILES_TABLE_NAME + ";", "drop table");
    }
    db_exec(db, std::string("CREATE TABLE IF NOT EXISTS ") + ARCHIVED_FILES_TABLE_NAME
        + " (id INTEGER PRIMARY KEY AUTOINCREMENT, file_id TEXT NOT NULL, name TEXT NOT NULL, local_path TEXT,"
        + " success INT NOT NULL, detail TEXT, dry_run INT NOT NULL, archived_at TEXT NOT NULL);", "create table");
}

void ArchiveJournal::record(const transfer_outcome_t &outcome, bool dry_run) {
    const auto insert_query = std::string("INSERT INTO ") + ARCHIVED_FILES_TABLE_NAME
        + " (file_id, name, local_path, success, detail, dry_run, archived_at) VALUES (?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), insert_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    const auto local_path = outcome.local_path.has_value() ? outcome.local_path->u8string() : std::string();
    const auto timestamp = current_timestamp();
    sqlite3_bind_text(stmt, 1, outcome.file_id.c_str(), (int) outcome.file_id.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, outcome.name.c_str(), (int) outcome.name.size(), SQLITE_TRANSIENT);
    if (outcome.local_path.has_value()) {
        sqlite3_bind_text(stmt, 3, local_path.c_str(), (int) local_path.size(), SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_int(stmt, 4, outcome.success ? 1 : 0);
    sqlite3_bind_text(stmt, 5, outcome.detail.c_str(), (int) outcome.detail.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 6, dry_run ? 1 : 0);
    sqlite3_bind_text(stmt, 7, timestamp.c_str(), (int) timestamp.size(), SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
}

std::vector<journal_entry_t> ArchiveJournal::entries() const {
    const auto select_query = std::string("SELECT file_id, name, local_path, success, detail, dry_run, archived_at FROM ")
        + ARCHIVED_FILES_TABLE_NAME + " ORDER BY id;";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), select_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    std::vector<journal_entry_t> ret;
    while (true) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
        }
        journal_entry_t entry;
        entry.file_id = column_string(stmt, 0);
        entry.name = column_string(stmt, 1);
        entry.local_path = column_string(stmt, 2);
        entry.success = sqlite3_column_int(stmt, 3) != 0;
        entry.detail = column_string(stmt, 4);
        entry.dry_run = sqlite3_column_int(stmt, 5) != 0;
        entry.archived_at = column_string(stmt, 6);
        ret.push_back(entry);
    }
    sqlite3_finalize(stmt);
    return ret;
}

std::unordered_set<std::string> ArchiveJournal::archived_ids() const {
    const auto select_query = std::string("SELECT DISTINCT file_id FROM ") + ARCHIVED_FILES_TABLE_NAME + " WHERE success=1 AND dry_run=0;";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), select_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    std::unordered_set<std::string> ret;
    while (true) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
        }
        ret.insert(column_string(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ret;
}

void ArchiveJournal::clear() {
    db_exec(db, std::string("DELETE FROM ") + ARCHIVED_FILES_TABLE_NAME + ";", "clear journal");
}
