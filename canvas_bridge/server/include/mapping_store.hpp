#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace canvas::server {

struct UploadedFile {
    std::string file_identity;
    std::string relative_path;
    std::string store_file_id;
};

struct CourseMapping {
    std::string vector_store_id;
    std::vector<UploadedFile> files;
};

// course_id -> mapping, ordered so projections are stable.
using VectorStoreMapping = std::map<std::string, CourseMapping>;

// Persistent course -> vector store table plus the set of file identities
// already uploaded per course. Rows are only ever added.
class MappingStore {
public:
    explicit MappingStore(const std::string& database_path);
    ~MappingStore();

    MappingStore(const MappingStore&) = delete;
    MappingStore& operator=(const MappingStore&) = delete;

    void initialize_schema();

    std::optional<std::string> find_store(const std::string& course_id);
    void record_store(const std::string& course_id, const std::string& vector_store_id);

    bool is_uploaded(const std::string& course_id, const std::string& file_identity);
    void record_upload(const std::string& course_id, const UploadedFile& file);

    VectorStoreMapping snapshot();

private:
    void exec(const char* sql, const std::string& context);

    std::mutex mutex_;
    sqlite3* db_{};
};

}  // namespace canvas::server
