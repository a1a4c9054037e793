#include "workflow_machine.hpp"

#include "errors.hpp"
#include "report_writer.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace canvas::server {

namespace {

// Leaves the session Idle however the job ends.
struct ReturnToIdle {
    Session& session;
    ~ReturnToIdle() { session.set_workflow(workflow::Idle{}); }
};

std::size_t parse_index(const protocol::Json& value) {
    if (value.is_number_integer()) {
        const auto index = value.get<long long>();
        return index > 0 ? static_cast<std::size_t>(index) : 0;
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (!text.empty() && text.size() < 10 &&
            std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return static_cast<std::size_t>(std::stoul(text));
        }
    }
    return 0;
}

std::string parse_course_id(const protocol::Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return {};
}

const protocol::Json& require_array(const protocol::Json& payload, const char* key) {
    const auto& value = payload.at(key);
    if (!value.is_array() || value.empty()) {
        throw ProtocolError(std::string("'") + key + "' must be a non-empty array.");
    }
    return value;
}

protocol::Json roster_message(const std::vector<RosterEntry>& roster) {
    auto entries = protocol::Json::array();
    for (const auto& entry : roster) {
        entries.push_back(
            {{"index", entry.index}, {"course_id", entry.course_id}, {"name", entry.name}, {"code", entry.code}});
    }
    return {{"type", protocol::kRoster}, {"entries", std::move(entries)}};
}

protocol::Json progress_message(const std::string& course_id, const CourseStats& stats) {
    return {{"type", protocol::kProgress},
            {"course_id", course_id},
            {"downloaded", stats.downloaded},
            {"skipped", stats.skipped},
            {"failed", stats.failed},
            {"uploaded", stats.uploaded},
            {"upload_skipped", stats.upload_skipped},
            {"upload_failed", stats.upload_failed}};
}

}  // namespace

WorkflowMachine::WorkflowMachine(CanvasClient* canvas,
                                 ChatAgent* agent,
                                 DownloadJobRunner& jobs,
                                 bool interactive_confirmation,
                                 Logger& logger)
    : canvas_(canvas),
      agent_(agent),
      jobs_(jobs),
      interactive_confirmation_(interactive_confirmation),
      logger_(logger) {}

void WorkflowMachine::handle(Session& session, const protocol::InboundMessage& message, const Emit& emit) {
    switch (message.kind) {
        case protocol::InboundKind::kChat:
            handle_chat(session, message.payload, emit);
            return;
        case protocol::InboundKind::kDownload:
            handle_download(session, message.payload, emit);
            return;
        case protocol::InboundKind::kCancel:
            handle_cancel(session, emit);
            return;
        case protocol::InboundKind::kAuth:
        case protocol::InboundKind::kUnknown:
            break;
    }
    throw ProtocolError("Unsupported message type: " + message.type);
}

void WorkflowMachine::handle_chat(Session& session, const protocol::Json& payload, const Emit& emit) {
    if (!std::holds_alternative<workflow::Idle>(session.workflow())) {
        throw ProtocolError("Chat is not accepted while a download is in progress (" +
                            workflow_name(session.workflow()) + ").");
    }
    const auto query_it = payload.find("query");
    if (query_it == payload.end() || !query_it->is_string() || query_it->get<std::string>().empty()) {
        throw ProtocolError("Chat message requires a non-empty 'query'.");
    }
    if (agent_ == nullptr) {
        throw FatalError("Chat agent is not configured.");
    }

    const auto query = query_it->get<std::string>();
    session.set_workflow(workflow::ChatPending{query});
    std::string answer;
    try {
        answer = agent_->answer(query);
    } catch (const std::exception& ex) {
        session.set_workflow(workflow::Idle{});
        throw FatalError(std::string("Chat agent failed: ") + ex.what());
    }
    session.set_workflow(workflow::Idle{});
    ++session.stats().chats_answered;
    emit({{"type", protocol::kChatResult}, {"text", answer}});
}

void WorkflowMachine::handle_cancel(Session& session, const Emit& emit) {
    const auto& state = session.workflow();
    if (!std::holds_alternative<workflow::DownloadAwaitingSelection>(state) &&
        !std::holds_alternative<workflow::DownloadAwaitingConfirmation>(state)) {
        throw ProtocolError("Nothing to cancel in state " + workflow_name(state) + ".");
    }
    session.set_workflow(workflow::Idle{});
    emit({{"type", protocol::kStatus}, {"status", "cancelled"}});
}

void WorkflowMachine::issue_roster(Session& session, const Emit& emit) {
    if (canvas_ == nullptr) {
        session.set_workflow(workflow::Idle{});
        throw FatalError("Canvas credentials are not configured.");
    }
    std::vector<CourseInfo> courses;
    try {
        courses = canvas_->list_courses();
    } catch (const std::exception& ex) {
        session.set_workflow(workflow::Idle{});
        throw FatalError(std::string("Unable to fetch course roster: ") + ex.what());
    }

    std::vector<RosterEntry> roster;
    roster.reserve(courses.size());
    for (auto& course : courses) {
        roster.push_back(RosterEntry{roster.size() + 1, std::move(course.id), std::move(course.name),
                                     std::move(course.code)});
    }
    emit(roster_message(roster));
    if (roster.empty()) {
        session.set_workflow(workflow::Idle{});
        return;
    }
    logger_.info(session.tag() + " roster issued with " + std::to_string(roster.size()) + " courses");
    session.set_workflow(workflow::DownloadAwaitingSelection{std::move(roster)});
}

std::vector<CourseInfo> WorkflowMachine::resolve_selection(const std::vector<RosterEntry>& roster,
                                                           const protocol::Json& payload) const {
    const bool by_index = payload.contains("course_indices");
    const bool by_id = payload.contains("course_ids");
    if (by_index && by_id) {
        throw ProtocolError("Send either 'course_indices' or 'course_ids', not both.");
    }

    std::vector<const RosterEntry*> picked;
    std::set<std::string> seen;
    auto take = [&](const RosterEntry& entry) {
        if (seen.insert(entry.course_id).second) {
            picked.push_back(&entry);
        }
    };

    if (by_index) {
        for (const auto& value : require_array(payload, "course_indices")) {
            const auto index = parse_index(value);
            if (index == 0 || index > roster.size()) {
                throw ProtocolError("Unknown course index: " + value.dump());
            }
            take(roster[index - 1]);
        }
    } else {
        for (const auto& value : require_array(payload, "course_ids")) {
            const auto course_id = parse_course_id(value);
            const auto it = std::find_if(roster.begin(), roster.end(),
                                         [&](const RosterEntry& entry) { return entry.course_id == course_id; });
            if (course_id.empty() || it == roster.end()) {
                throw ProtocolError("Unknown course id: " + value.dump());
            }
            take(*it);
        }
    }

    std::vector<CourseInfo> selected;
    selected.reserve(picked.size());
    for (const auto* entry : picked) {
        selected.push_back(CourseInfo{entry->course_id, entry->name, entry->code});
    }
    return selected;
}

void WorkflowMachine::handle_download(Session& session, const protocol::Json& payload, const Emit& emit) {
    const auto& state = session.workflow();
    const bool has_selection = payload.contains("course_indices") || payload.contains("course_ids");

    if (payload.contains("confirm")) {
        const auto* pending = std::get_if<workflow::DownloadAwaitingConfirmation>(&state);
        if (pending == nullptr) {
            throw ProtocolError("No download is awaiting confirmation.");
        }
        if (!payload["confirm"].is_boolean()) {
            throw ProtocolError("'confirm' must be a boolean.");
        }
        if (!payload["confirm"].get<bool>()) {
            session.set_workflow(workflow::Idle{});
            emit({{"type", protocol::kStatus}, {"status", "cancelled"}});
            return;
        }
        auto selected = pending->selected;
        const bool skip_download = pending->skip_download;
        execute(session, std::move(selected), skip_download, emit);
        return;
    }

    if (!has_selection) {
        if (std::holds_alternative<workflow::Idle>(state) ||
            std::holds_alternative<workflow::DownloadAwaitingSelection>(state) ||
            std::holds_alternative<workflow::DownloadAwaitingConfirmation>(state)) {
            issue_roster(session, emit);
            return;
        }
        throw ProtocolError("Download request not accepted in state " + workflow_name(state) + ".");
    }

    const std::vector<RosterEntry>* roster = nullptr;
    if (const auto* selecting = std::get_if<workflow::DownloadAwaitingSelection>(&state)) {
        roster = &selecting->roster;
    } else if (const auto* confirming = std::get_if<workflow::DownloadAwaitingConfirmation>(&state)) {
        roster = &confirming->roster;
    } else {
        throw ProtocolError("No course roster has been issued; send a download request first.");
    }

    auto selected = resolve_selection(*roster, payload);

    bool auto_confirm = !interactive_confirmation_;
    if (payload.contains("auto_confirm")) {
        if (!payload["auto_confirm"].is_boolean()) {
            throw ProtocolError("'auto_confirm' must be a boolean.");
        }
        auto_confirm = payload["auto_confirm"].get<bool>();
    }
    bool skip_download = false;
    if (payload.contains("skip_download")) {
        if (!payload["skip_download"].is_boolean()) {
            throw ProtocolError("'skip_download' must be a boolean.");
        }
        skip_download = payload["skip_download"].get<bool>();
    }

    if (auto_confirm) {
        execute(session, std::move(selected), skip_download, emit);
        return;
    }

    auto courses = protocol::Json::array();
    for (const auto& course : selected) {
        courses.push_back({{"course_id", course.id}, {"name", course.name}});
    }
    auto roster_copy = *roster;
    session.set_workflow(
        workflow::DownloadAwaitingConfirmation{std::move(roster_copy), std::move(selected), skip_download});
    emit({{"type", protocol::kConfirmation}, {"courses", std::move(courses)}, {"skip_download", skip_download}});
}

void WorkflowMachine::execute(Session& session,
                              std::vector<CourseInfo> selected,
                              bool skip_download,
                              const Emit& emit) {
    JobRequest request{selected, skip_download};
    session.set_workflow(workflow::DownloadExecuting{std::move(selected), {}});
    logger_.info(session.tag() + " download started for " + std::to_string(request.courses.size()) + " courses");

    auto on_progress = [&session, &emit](const std::string& course_id, const CourseStats& stats) {
        session.record_progress(course_id, stats);
        emit(progress_message(course_id, stats));
    };
    JobOutcome outcome;
    {
        ReturnToIdle idle_on_exit{session};
        outcome = jobs_.run(request, on_progress, session.cancel_flag());
    }

    if (outcome.cancelled) {
        logger_.info(session.tag() + " download cancelled");
        return;
    }

    auto per_course = protocol::Json::object();
    for (const auto& [course_id, stats] : outcome.per_course) {
        per_course[course_id] = ReportWriter::stats_to_json(stats);
    }
    protocol::Json summary{{"type", protocol::kSummary},
                           {"status", outcome.completed ? "completed" : "failed"},
                           {"per_course_stats", std::move(per_course)},
                           {"report_path", outcome.report_path},
                           {"mapping_path", outcome.mapping_path}};
    if (!outcome.completed) {
        summary["error"] = outcome.error;
        emit({{"type", protocol::kError},
              {"kind", error_kind_name(ErrorKind::kFatal)},
              {"message", outcome.error}});
    } else {
        ++session.stats().jobs_completed;
    }
    emit(summary);
}

}  // namespace canvas::server
