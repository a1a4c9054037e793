#include "sync_engine.hpp"

#include "errors.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace canvas::server {

std::size_t SyncPlan::fetch_count() const {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [](const PlannedFile& entry) {
        return entry.action == SyncAction::kFetch;
    }));
}

std::size_t SyncPlan::skip_count() const {
    return entries.size() - fetch_count();
}

SyncPlan plan_sync(const CourseInfo& course,
                   const std::vector<RemoteFile>& listing,
                   const std::vector<FileRecord>& manifest) {
    std::map<std::string, const FileRecord*> known;
    for (const auto& record : manifest) {
        if (record.course_id == course.id) {
            known.emplace(record.relative_path, &record);
        }
    }

    SyncPlan plan;
    plan.course_id = course.id;
    plan.entries.reserve(listing.size());
    for (const auto& remote : listing) {
        PlannedFile entry;
        entry.remote = remote;
        entry.remote.course_id = course.id;
        const auto it = known.find(remote.relative_path);
        const bool unchanged = it != known.end() && it->second->signature == remote.signature &&
                               it->second->local_presence;
        entry.action = unchanged ? SyncAction::kSkip : SyncAction::kFetch;
        plan.entries.push_back(std::move(entry));
    }
    return plan;
}

SyncEngine::SyncEngine(CanvasClient& canvas, ManifestStore& manifest, StorageManager& storage, Logger& logger)
    : canvas_(canvas), manifest_(manifest), storage_(storage), logger_(logger) {}

std::vector<FileRecord> SyncEngine::load_manifest(const std::string& course_id) {
    auto records = manifest_.load_course(course_id);
    for (auto& record : records) {
        try {
            record.local_presence = storage_.exists(course_id, record.relative_path);
        } catch (const std::runtime_error& ex) {
            logger_.warn("Manifest entry " + record.relative_path + " of course " + course_id +
                         " ignored: " + ex.what());
            record.local_presence = false;
        }
    }
    return records;
}

SyncPlan SyncEngine::plan(const CourseInfo& course) {
    std::vector<RemoteFile> listing;
    try {
        listing = canvas_.list_files(course);
    } catch (const BridgeError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ExternalFetchError("Listing files of course " + course.id + " failed: " + ex.what());
    }
    auto plan = plan_sync(course, listing, load_manifest(course.id));
    logger_.info("Course " + course.id + ": " + std::to_string(plan.fetch_count()) + " to fetch, " +
                 std::to_string(plan.skip_count()) + " unchanged");
    return plan;
}

void SyncEngine::execute(const SyncPlan& plan,
                         CourseStats& stats,
                         const PresentCallback& on_present,
                         const StepCallback& on_step,
                         const std::atomic<bool>& cancelled) {
    for (const auto& entry : plan.entries) {
        if (cancelled.load()) {
            logger_.info("Course " + plan.course_id + " sync cancelled");
            return;
        }
        const auto& remote = entry.remote;
        FileRecord record{remote.file_id, plan.course_id, remote.relative_path, remote.signature, true};

        if (entry.action == SyncAction::kSkip) {
            ++stats.skipped;
            if (on_present) {
                on_present(record);
            }
            if (on_step) {
                on_step(stats);
            }
            continue;
        }

        std::uint64_t written = 0;
        try {
            const auto contents = canvas_.download(remote);
            if (cancelled.load()) {
                // The fetch completed after a disconnect; its bytes are dropped.
                return;
            }
            storage_.write_file(plan.course_id, remote.relative_path, contents);
            written = contents.size();
        } catch (const std::exception& ex) {
            ++stats.failed;
            const ExternalFetchError error(remote.relative_path + ": " + ex.what());
            stats.record_error(error.what());
            logger_.warn("Fetch failed for course " + plan.course_id + ": " + error.what());
            manifest_.remove(plan.course_id, remote.relative_path);
            if (on_step) {
                on_step(stats);
            }
            continue;
        }

        manifest_.upsert(record);
        ++stats.downloaded;
        stats.bytes += written;
        if (on_present) {
            on_present(record);
        }
        if (on_step) {
            on_step(stats);
        }
    }
}

}  // namespace canvas::server
