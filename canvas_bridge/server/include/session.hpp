#pragma once

#include "collaborators.hpp"
#include "course_stats.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace canvas::server {

struct RosterEntry {
    std::size_t index = 0;
    std::string course_id;
    std::string name;
    std::string code;
};

namespace workflow {

struct Idle {};

struct ChatPending {
    std::string query;
};

struct DownloadAwaitingSelection {
    std::vector<RosterEntry> roster;
};

struct DownloadAwaitingConfirmation {
    std::vector<RosterEntry> roster;
    std::vector<CourseInfo> selected;
    bool skip_download = false;
};

struct DownloadExecuting {
    std::vector<CourseInfo> selected;
    std::map<std::string, CourseStats> progress;
};

}  // namespace workflow

using Workflow = std::variant<workflow::Idle,
                              workflow::ChatPending,
                              workflow::DownloadAwaitingSelection,
                              workflow::DownloadAwaitingConfirmation,
                              workflow::DownloadExecuting>;

std::string workflow_name(const Workflow& workflow);

struct SessionStats {
    std::size_t chats_answered = 0;
    std::size_t jobs_completed = 0;
    std::size_t auth_failures = 0;
};

// Per-connection state. Only the connection's own dispatch task mutates it,
// except record_progress() which transfer workers call during a job.
class Session {
public:
    Session(std::uint64_t connection_id, std::string peer);

    std::uint64_t id() const { return id_; }
    const std::string& peer() const { return peer_; }
    std::string tag() const { return "conn#" + std::to_string(id_); }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    bool authenticated() const { return authenticated_; }
    void mark_authenticated() { authenticated_ = true; }

    const Workflow& workflow() const { return workflow_; }
    void set_workflow(Workflow next) { workflow_ = std::move(next); }

    void record_progress(const std::string& course_id, const CourseStats& stats);

    SessionStats& stats() { return stats_; }
    const SessionStats& stats() const { return stats_; }

    // Shared with running jobs; set once the connection goes away.
    std::shared_ptr<std::atomic<bool>> cancel_flag() const { return cancelled_; }
    void cancel() { cancelled_->store(true); }
    bool cancelled() const { return cancelled_->load(); }

private:
    std::uint64_t id_;
    std::string peer_;
    std::chrono::system_clock::time_point created_at_;
    bool authenticated_ = false;
    Workflow workflow_;
    SessionStats stats_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::mutex progress_mutex_;
};

}  // namespace canvas::server
