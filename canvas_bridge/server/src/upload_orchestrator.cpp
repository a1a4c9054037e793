#include "upload_orchestrator.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace canvas::server {

namespace {
constexpr std::size_t kMaxStoreNameLength = 100;

std::string lower_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}
}  // namespace

UploadOrchestrator::UploadOrchestrator(VectorStoreProvider& provider,
                                       MappingStore& mapping,
                                       StorageManager& storage,
                                       UploadPolicy policy,
                                       Logger& logger)
    : provider_(provider), mapping_(mapping), storage_(storage), policy_(std::move(policy)), logger_(logger) {}

std::string UploadOrchestrator::file_identity(const FileRecord& record) {
    return record.file_id + "@" + record.signature;
}

std::string UploadOrchestrator::store_name(const CourseInfo& course) {
    std::string name = course.code.empty() ? course.name : course.code + "_" + course.name;
    if (name.empty()) {
        name = "course_" + course.id;
    }
    if (name.size() > kMaxStoreNameLength) {
        name.resize(kMaxStoreNameLength);
    }
    return name;
}

bool UploadOrchestrator::eligible(const std::filesystem::path& relative_path, std::uint64_t size) const {
    if (policy_.extensions.count(lower_extension(relative_path)) == 0) {
        return false;
    }
    return policy_.max_file_bytes == 0 || size <= policy_.max_file_bytes;
}

std::string UploadOrchestrator::ensure_store(const CourseInfo& course) {
    std::lock_guard<std::mutex> lock(store_mutex_);
    if (auto existing = mapping_.find_store(course.id)) {
        return *existing;
    }
    std::string store_id;
    try {
        store_id = provider_.create_store(store_name(course));
    } catch (const std::exception& ex) {
        throw ExternalUploadError("Creating vector store for course " + course.id + " failed: " + ex.what());
    }
    if (store_id.empty()) {
        throw ExternalUploadError("Vector store provider returned no id for course " + course.id);
    }
    mapping_.record_store(course.id, store_id);
    logger_.info("Created vector store " + store_id + " for course " + course.id);
    return *mapping_.find_store(course.id);
}

UploadResult UploadOrchestrator::maybe_upload(const CourseInfo& course, const FileRecord& record) {
    UploadResult result;
    std::filesystem::path absolute;
    try {
        absolute = storage_.resolve(course.id, record.relative_path);
    } catch (const std::runtime_error& ex) {
        result.status = UploadStatus::kFailed;
        result.error = record.relative_path + ": " + ex.what();
        return result;
    }
    if (!eligible(record.relative_path, storage_.file_size(absolute))) {
        result.status = UploadStatus::kSkippedUnsupported;
        return result;
    }

    const auto identity = file_identity(record);
    if (mapping_.is_uploaded(course.id, identity)) {
        result.status = UploadStatus::kSkippedDuplicate;
        return result;
    }

    try {
        const auto store_id = ensure_store(course);
        result.store_file_id = provider_.upload(store_id, absolute);
    } catch (const ExternalUploadError& ex) {
        result.status = UploadStatus::kFailed;
        result.error = ex.what();
        logger_.warn("Upload failed for course " + course.id + ": " + ex.what());
        return result;
    } catch (const StorageError&) {
        throw;
    } catch (const std::exception& ex) {
        result.status = UploadStatus::kFailed;
        result.error = record.relative_path + ": " + ex.what();
        logger_.warn("Upload failed for course " + course.id + ": " + result.error);
        return result;
    }

    mapping_.record_upload(course.id, UploadedFile{identity, record.relative_path, result.store_file_id});
    result.status = UploadStatus::kUploaded;
    logger_.debug("Uploaded " + record.relative_path + " of course " + course.id);
    return result;
}

}  // namespace canvas::server
