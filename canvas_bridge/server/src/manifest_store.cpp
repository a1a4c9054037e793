#include "manifest_store.hpp"

#include "errors.hpp"

#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

namespace canvas::server {

namespace {

constexpr int kBusyTimeoutMs = 5000;

FileRecord read_row(sqlite3_stmt* stmt) {
    FileRecord record;
    record.file_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    record.course_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    record.relative_path = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
    record.signature = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
    return record;
}

}  // namespace

ManifestStore::ManifestStore(const std::string& database_path) {
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open manifest database: " + reason);
    }
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
}

ManifestStore::~ManifestStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void ManifestStore::initialize_schema() {
    const char* ddl = R"SQL(
        CREATE TABLE IF NOT EXISTS local_manifest (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_id TEXT NOT NULL,
            course_id TEXT NOT NULL,
            relative_path TEXT NOT NULL,
            signature TEXT NOT NULL,
            updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            UNIQUE(course_id, relative_path)
        );
        CREATE INDEX IF NOT EXISTS idx_local_manifest_course ON local_manifest(course_id);
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    char* err = nullptr;
    if (sqlite3_exec(db_, ddl, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError("Failed to initialize manifest: " + msg);
    }
}

std::vector<FileRecord> ManifestStore::load_course(const std::string& course_id) {
    const char* sql = R"SQL(
        SELECT file_id,course_id,relative_path,signature FROM local_manifest
        WHERE course_id=?
        ORDER BY relative_path
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to read manifest: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, course_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<FileRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(read_row(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to read manifest: " + std::string(sqlite3_errmsg(db_)));
    }
    return records;
}

std::optional<FileRecord> ManifestStore::find(const std::string& course_id, const std::string& relative_path) {
    const char* sql = R"SQL(
        SELECT file_id,course_id,relative_path,signature FROM local_manifest
        WHERE course_id=? AND relative_path=?
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to read manifest: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, course_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, relative_path.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<FileRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = read_row(stmt);
    }
    sqlite3_finalize(stmt);
    return record;
}

void ManifestStore::upsert(const FileRecord& record) {
    const char* sql = R"SQL(
        INSERT INTO local_manifest(file_id, course_id, relative_path, signature)
        VALUES(?,?,?,?)
        ON CONFLICT(course_id, relative_path)
        DO UPDATE SET file_id=excluded.file_id,
                      signature=excluded.signature,
                      updated_at=CURRENT_TIMESTAMP
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to update manifest: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, record.file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.course_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.relative_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, record.signature.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to update manifest: " + std::string(sqlite3_errmsg(db_)));
    }
}

void ManifestStore::remove(const std::string& course_id, const std::string& relative_path) {
    const char* sql = "DELETE FROM local_manifest WHERE course_id=? AND relative_path=?";
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to update manifest: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, course_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, relative_path.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to update manifest: " + std::string(sqlite3_errmsg(db_)));
    }
}

}  // namespace canvas::server
