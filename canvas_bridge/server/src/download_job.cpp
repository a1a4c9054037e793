#include "download_job.hpp"

#include "errors.hpp"

#include <future>
#include <string>
#include <utility>

namespace canvas::server {

namespace {
constexpr std::size_t kProgressEvery = 10;
}

DownloadJobRunner::DownloadJobRunner(SyncEngine& sync,
                                     UploadOrchestrator* uploader,
                                     MappingStore& mapping,
                                     CourseLockTable& locks,
                                     TaskExecutor& transfer_pool,
                                     ReportWriter& reports,
                                     Logger& logger)
    : sync_(sync),
      uploader_(uploader),
      mapping_(mapping),
      locks_(locks),
      transfer_pool_(transfer_pool),
      reports_(reports),
      logger_(logger) {}

void DownloadJobRunner::offer_upload(const CourseInfo& course, const FileRecord& record, CourseStats& stats) {
    if (uploader_ == nullptr) {
        return;
    }
    const auto result = uploader_->maybe_upload(course, record);
    switch (result.status) {
        case UploadStatus::kUploaded:
            ++stats.uploaded;
            break;
        case UploadStatus::kSkippedUnsupported:
        case UploadStatus::kSkippedDuplicate:
            ++stats.upload_skipped;
            break;
        case UploadStatus::kFailed:
            ++stats.upload_failed;
            stats.record_error(result.error);
            break;
    }
}

CourseStats DownloadJobRunner::run_course(const CourseInfo& course,
                                          bool skip_download,
                                          const ProgressCallback& on_progress,
                                          const std::atomic<bool>& cancelled) {
    CourseStats stats;
    auto course_lock = locks_.acquire(course.id);
    if (cancelled.load()) {
        return stats;
    }

    auto on_present = [&](const FileRecord& record) {
        if (!cancelled.load()) {
            offer_upload(course, record, stats);
        }
    };

    if (skip_download) {
        for (const auto& record : sync_.load_manifest(course.id)) {
            if (cancelled.load()) {
                break;
            }
            if (!record.local_presence) {
                continue;
            }
            ++stats.skipped;
            on_present(record);
        }
    } else {
        SyncPlan plan;
        try {
            plan = sync_.plan(course);
        } catch (const ExternalFetchError& ex) {
            stats.record_error(ex.what());
            logger_.warn(ex.what());
            return stats;
        }
        auto on_step = [&](const CourseStats& current) {
            if (on_progress && current.processed() % kProgressEvery == 0) {
                on_progress(course.id, current);
            }
        };
        sync_.execute(plan, stats, on_present, on_step, cancelled);
    }

    if (on_progress && !cancelled.load()) {
        on_progress(course.id, stats);
    }
    logger_.info("Course " + course.id + " done: downloaded=" + std::to_string(stats.downloaded) +
                 " skipped=" + std::to_string(stats.skipped) + " failed=" + std::to_string(stats.failed) +
                 " uploaded=" + std::to_string(stats.uploaded));
    return stats;
}

JobOutcome DownloadJobRunner::run(const JobRequest& request,
                                  const ProgressCallback& on_progress,
                                  std::shared_ptr<std::atomic<bool>> cancelled) {
    JobOutcome outcome;
    outcome.report_path = reports_.report_path().string();
    outcome.mapping_path = reports_.mapping_path().string();

    std::vector<std::pair<std::string, std::future<CourseStats>>> pending;
    pending.reserve(request.courses.size());
    const bool skip_download = request.skip_download;
    if (transfer_pool_.busy() > 0) {
        logger_.debug("Transfer pool busy with " + std::to_string(transfer_pool_.busy()) + " courses, " +
                      std::to_string(transfer_pool_.queued()) + " queued");
    }
    try {
        for (const auto& course : request.courses) {
            pending.emplace_back(course.id,
                                 transfer_pool_.submit([this, course, skip_download, on_progress, cancelled]() {
                                     return run_course(course, skip_download, on_progress, *cancelled);
                                 }));
        }
    } catch (const std::exception& ex) {
        logger_.error(std::string("Unable to schedule course transfers: ") + ex.what());
        for (auto& entry : pending) {
            entry.second.wait();
        }
        throw;
    }

    // Every future is drained before returning so no worker still touches
    // this job's state afterwards.
    for (auto& [course_id, future] : pending) {
        try {
            outcome.per_course[course_id] = future.get();
        } catch (const std::exception& ex) {
            logger_.error("Course " + course_id + " aborted the job: " + ex.what());
            if (outcome.error.empty()) {
                outcome.error = ex.what();
            }
        }
    }

    if (cancelled->load()) {
        outcome.cancelled = true;
        return outcome;
    }
    if (!outcome.error.empty()) {
        return outcome;
    }

    try {
        reports_.write_report(outcome.per_course);
        reports_.write_mapping(mapping_.snapshot());
    } catch (const StorageError& ex) {
        outcome.error = ex.what();
        logger_.error(std::string("Report projection failed: ") + ex.what());
        return outcome;
    }
    outcome.completed = true;
    return outcome;
}

}  // namespace canvas::server
