#pragma once

#include "collaborators.hpp"
#include "download_job.hpp"
#include "logger.hpp"
#include "messages.hpp"
#include "session.hpp"

#include <functional>
#include <string>
#include <vector>

namespace canvas::server {

using Emit = std::function<void(const protocol::Json&)>;

// Transition table for authenticated sessions:
//
//   Idle                 chat{query}            -> ChatPending -> Idle
//   Idle                 download{}             -> AwaitingSelection (empty roster stays Idle)
//   AwaitingSelection    download{}             -> AwaitingSelection (fresh roster)
//   AwaitingSelection    download{selection}    -> Executing | AwaitingConfirmation
//   AwaitingConfirmation download{confirm:bool} -> Executing | Idle
//   Awaiting*            cancel                 -> Idle
//   Executing            (job finished)         -> Idle
//
// Anything else raises ProtocolError and leaves the workflow unchanged.
class WorkflowMachine {
public:
    // canvas and agent may be null when their credentials are not configured.
    WorkflowMachine(CanvasClient* canvas,
                    ChatAgent* agent,
                    DownloadJobRunner& jobs,
                    bool interactive_confirmation,
                    Logger& logger);

    void handle(Session& session, const protocol::InboundMessage& message, const Emit& emit);

private:
    void handle_chat(Session& session, const protocol::Json& payload, const Emit& emit);
    void handle_download(Session& session, const protocol::Json& payload, const Emit& emit);
    void handle_cancel(Session& session, const Emit& emit);

    void issue_roster(Session& session, const Emit& emit);
    std::vector<CourseInfo> resolve_selection(const std::vector<RosterEntry>& roster,
                                              const protocol::Json& payload) const;
    void execute(Session& session, std::vector<CourseInfo> selected, bool skip_download, const Emit& emit);

    CanvasClient* canvas_;
    ChatAgent* agent_;
    DownloadJobRunner& jobs_;
    bool interactive_confirmation_;
    Logger& logger_;
};

}  // namespace canvas::server
