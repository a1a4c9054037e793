#pragma once

#include "collaborators.hpp"
#include "logger.hpp"
#include "manifest_store.hpp"
#include "mapping_store.hpp"
#include "storage_manager.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace canvas::server {

struct UploadPolicy {
    // Lower-case, dot-prefixed.
    std::set<std::string> extensions;
    std::uint64_t max_file_bytes = 0;
};

enum class UploadStatus {
    kUploaded,
    kSkippedUnsupported,
    kSkippedDuplicate,
    kFailed,
};

struct UploadResult {
    UploadStatus status = UploadStatus::kFailed;
    std::string store_file_id;
    std::string error;
};

class UploadOrchestrator {
public:
    UploadOrchestrator(VectorStoreProvider& provider,
                       MappingStore& mapping,
                       StorageManager& storage,
                       UploadPolicy policy,
                       Logger& logger);

    // Provider failures come back as kFailed; StorageError propagates.
    UploadResult maybe_upload(const CourseInfo& course, const FileRecord& record);

    bool eligible(const std::filesystem::path& relative_path, std::uint64_t size) const;

    static std::string file_identity(const FileRecord& record);
    static std::string store_name(const CourseInfo& course);

private:
    std::string ensure_store(const CourseInfo& course);

    VectorStoreProvider& provider_;
    MappingStore& mapping_;
    StorageManager& storage_;
    UploadPolicy policy_;
    Logger& logger_;
    // Serializes store creation so two courses never race on one row.
    std::mutex store_mutex_;
};

}  // namespace canvas::server
