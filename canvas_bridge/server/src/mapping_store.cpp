#include "mapping_store.hpp"

#include "errors.hpp"

#include <filesystem>

#include <sqlite3.h>

namespace canvas::server {

namespace {

constexpr int kBusyTimeoutMs = 5000;

std::string column_text(sqlite3_stmt* stmt, int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace

MappingStore::MappingStore(const std::string& database_path) {
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open mapping database: " + reason);
    }
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
}

MappingStore::~MappingStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void MappingStore::exec(const char* sql, const std::string& context) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError(context + ": " + msg);
    }
}

void MappingStore::initialize_schema() {
    const char* ddl = R"SQL(
        CREATE TABLE IF NOT EXISTS vector_stores (
            course_id TEXT PRIMARY KEY,
            vector_store_id TEXT NOT NULL,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );
        CREATE TABLE IF NOT EXISTS uploaded_files (
            course_id TEXT NOT NULL,
            file_identity TEXT NOT NULL,
            relative_path TEXT NOT NULL,
            store_file_id TEXT NOT NULL,
            uploaded_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            PRIMARY KEY(course_id, file_identity)
        );
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    exec(ddl, "Failed to initialize mapping tables");
}

std::optional<std::string> MappingStore::find_store(const std::string& course_id) {
    const char* sql = "SELECT vector_store_id FROM vector_stores WHERE course_id=?";
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to read mapping: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, course_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> store_id;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        store_id = column_text(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return store_id;
}

void MappingStore::record_store(const std::string& course_id, const std::string& vector_store_id) {
    const char* sql = R"SQL(
        INSERT INTO vector_stores(course_id, vector_store_id) VALUES(?,?)
        ON CONFLICT(course_id) DO NOTHING
    )SQL";
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to record vector store: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, course_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, vector_store_id.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to record vector store: " + std::string(sqlite3_errmsg(db_)));
    }
}

bool MappingStore::is_uploaded(const std::string& course_id, const std::string& file_identity) {
    const char* sql = "SELECT 1 FROM uploaded_files WHERE course_id=? AND file_identity=?";
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to read mapping: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, course_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, file_identity.c_str(), -1, SQLITE_TRANSIENT);
    const bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

void MappingStore::record_upload(const std::string& course_id, const UploadedFile& file) {
    const char* sql = R"SQL(
        INSERT INTO uploaded_files(course_id, file_identity, relative_path, store_file_id)
        VALUES(?,?,?,?)
        ON CONFLICT(course_id, file_identity) DO NOTHING
    )SQL";
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to record upload: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, course_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, file.file_identity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, file.relative_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, file.store_file_id.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to record upload: " + std::string(sqlite3_errmsg(db_)));
    }
}

VectorStoreMapping MappingStore::snapshot() {
    VectorStoreMapping mapping;
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT course_id,vector_store_id FROM vector_stores", -1, &stmt, nullptr) !=
        SQLITE_OK) {
        throw StorageError("Failed to read mapping: " + std::string(sqlite3_errmsg(db_)));
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        mapping[column_text(stmt, 0)].vector_store_id = column_text(stmt, 1);
    }
    sqlite3_finalize(stmt);

    const char* files_sql = R"SQL(
        SELECT course_id,file_identity,relative_path,store_file_id FROM uploaded_files
        ORDER BY course_id, relative_path, file_identity
    )SQL";
    if (sqlite3_prepare_v2(db_, files_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("Failed to read mapping: " + std::string(sqlite3_errmsg(db_)));
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        mapping[column_text(stmt, 0)].files.push_back(
            UploadedFile{column_text(stmt, 1), column_text(stmt, 2), column_text(stmt, 3)});
    }
    sqlite3_finalize(stmt);
    return mapping;
}

}  // namespace canvas::server
