#pragma once

#include "collaborators.hpp"
#include "course_lock.hpp"
#include "course_stats.hpp"
#include "logger.hpp"
#include "mapping_store.hpp"
#include "report_writer.hpp"
#include "sync_engine.hpp"
#include "task_executor.hpp"
#include "upload_orchestrator.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace canvas::server {

struct JobRequest {
    std::vector<CourseInfo> courses;
    // Upload-only: offer files already on disk without listing Canvas.
    bool skip_download = false;
};

struct JobOutcome {
    bool completed = false;
    bool cancelled = false;
    std::string error;
    std::map<std::string, CourseStats> per_course;
    std::string report_path;
    std::string mapping_path;
};

// Called from transfer workers, possibly concurrently for different courses.
using ProgressCallback = std::function<void(const std::string& course_id, const CourseStats& stats)>;

// Runs one DownloadExecuting workflow: every selected course is planned and
// executed on the transfer pool under its course lock, then the results are
// projected to the report and mapping files.
class DownloadJobRunner {
public:
    DownloadJobRunner(SyncEngine& sync,
                      UploadOrchestrator* uploader,
                      MappingStore& mapping,
                      CourseLockTable& locks,
                      TaskExecutor& transfer_pool,
                      ReportWriter& reports,
                      Logger& logger);

    JobOutcome run(const JobRequest& request,
                   const ProgressCallback& on_progress,
                   std::shared_ptr<std::atomic<bool>> cancelled);

private:
    CourseStats run_course(const CourseInfo& course,
                           bool skip_download,
                           const ProgressCallback& on_progress,
                           const std::atomic<bool>& cancelled);
    void offer_upload(const CourseInfo& course, const FileRecord& record, CourseStats& stats);

    SyncEngine& sync_;
    UploadOrchestrator* uploader_;
    MappingStore& mapping_;
    CourseLockTable& locks_;
    TaskExecutor& transfer_pool_;
    ReportWriter& reports_;
    Logger& logger_;
};

}  // namespace canvas::server
