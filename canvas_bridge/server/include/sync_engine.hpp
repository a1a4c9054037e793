#pragma once

#include "collaborators.hpp"
#include "course_stats.hpp"
#include "logger.hpp"
#include "manifest_store.hpp"
#include "storage_manager.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace canvas::server {

enum class SyncAction {
    kSkip,
    kFetch,
};

struct PlannedFile {
    SyncAction action = SyncAction::kFetch;
    RemoteFile remote;
};

struct SyncPlan {
    std::string course_id;
    std::vector<PlannedFile> entries;

    std::size_t fetch_count() const;
    std::size_t skip_count() const;
};

// Pure decision step. Keeps the listing order; a file is skipped iff the
// manifest holds the same (course_id, relative_path) with an identical
// signature and the file is still on disk.
SyncPlan plan_sync(const CourseInfo& course,
                   const std::vector<RemoteFile>& listing,
                   const std::vector<FileRecord>& manifest);

class SyncEngine {
public:
    // Invoked for every file that is on disk after its step, fetched or skipped.
    using PresentCallback = std::function<void(const FileRecord&)>;
    // Invoked after each processed plan entry.
    using StepCallback = std::function<void(const CourseStats&)>;

    SyncEngine(CanvasClient& canvas, ManifestStore& manifest, StorageManager& storage, Logger& logger);

    std::vector<FileRecord> load_manifest(const std::string& course_id);

    // Lists the course and plans against the manifest. Listing failures
    // surface as ExternalFetchError.
    SyncPlan plan(const CourseInfo& course);

    // Per-file fetch failures are counted in stats and never abort the plan.
    // Manifest write failures escape as StorageError.
    void execute(const SyncPlan& plan,
                 CourseStats& stats,
                 const PresentCallback& on_present,
                 const StepCallback& on_step,
                 const std::atomic<bool>& cancelled);

private:
    CanvasClient& canvas_;
    ManifestStore& manifest_;
    StorageManager& storage_;
    Logger& logger_;
};

}  // namespace canvas::server
