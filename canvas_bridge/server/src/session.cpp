#include "session.hpp"

#include <type_traits>

namespace canvas::server {

std::string workflow_name(const Workflow& workflow) {
    return std::visit(
        [](const auto& state) -> std::string {
            using State = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<State, workflow::Idle>) {
                return "Idle";
            } else if constexpr (std::is_same_v<State, workflow::ChatPending>) {
                return "ChatPending";
            } else if constexpr (std::is_same_v<State, workflow::DownloadAwaitingSelection>) {
                return "DownloadAwaitingSelection";
            } else if constexpr (std::is_same_v<State, workflow::DownloadAwaitingConfirmation>) {
                return "DownloadAwaitingConfirmation";
            } else {
                return "DownloadExecuting";
            }
        },
        workflow);
}

Session::Session(std::uint64_t connection_id, std::string peer)
    : id_(connection_id),
      peer_(std::move(peer)),
      created_at_(std::chrono::system_clock::now()),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

void Session::record_progress(const std::string& course_id, const CourseStats& stats) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    if (auto* executing = std::get_if<workflow::DownloadExecuting>(&workflow_)) {
        executing->progress[course_id] = stats;
    }
}

}  // namespace canvas::server
