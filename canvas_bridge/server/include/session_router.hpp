#pragma once

#include "credential_verifier.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "messages.hpp"
#include "session.hpp"
#include "workflow_machine.hpp"

#include <chrono>
#include <functional>
#include <string_view>

namespace canvas::server {

// Entry point for every inbound text message of a connection. Enforces the
// authentication gate, then hands the message to the workflow machine.
// Every failure is turned into an error message; nothing escapes.
class SessionRouter {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    SessionRouter(const CredentialVerifier& verifier, WorkflowMachine& workflow, Logger& logger, Clock clock = {});

    void handle_text(Session& session, std::string_view text, const Emit& emit);

    static protocol::Json error_message(ErrorKind kind, const std::string& message);

private:
    void authenticate(Session& session, const protocol::Json& payload, const Emit& emit);

    const CredentialVerifier& verifier_;
    WorkflowMachine& workflow_;
    Logger& logger_;
    Clock clock_;
};

}  // namespace canvas::server
