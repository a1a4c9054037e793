#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace canvas::server {

struct FileRecord {
    std::string file_id;
    std::string course_id;
    std::string relative_path;
    std::string signature;
    // Filled from the download root when the manifest is loaded.
    bool local_presence = false;
};

// Durable record of which remote files have been fetched, keyed by
// (course_id, relative_path). Write failures raise StorageError.
class ManifestStore {
public:
    explicit ManifestStore(const std::string& database_path);
    ~ManifestStore();

    ManifestStore(const ManifestStore&) = delete;
    ManifestStore& operator=(const ManifestStore&) = delete;

    void initialize_schema();
    std::vector<FileRecord> load_course(const std::string& course_id);
    std::optional<FileRecord> find(const std::string& course_id, const std::string& relative_path);
    void upsert(const FileRecord& record);
    void remove(const std::string& course_id, const std::string& relative_path);

private:
    std::mutex mutex_;
    sqlite3* db_{};
};

}  // namespace canvas::server
