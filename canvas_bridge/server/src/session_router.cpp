#include "session_router.hpp"

namespace canvas::server {

namespace {
constexpr const char* kAuthFailed = "Authentication failed.";
}

SessionRouter::SessionRouter(const CredentialVerifier& verifier, WorkflowMachine& workflow, Logger& logger, Clock clock)
    : verifier_(verifier), workflow_(workflow), logger_(logger), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

protocol::Json SessionRouter::error_message(ErrorKind kind, const std::string& message) {
    return {{"type", protocol::kError}, {"kind", std::string(error_kind_name(kind))}, {"message", message}};
}

void SessionRouter::authenticate(Session& session, const protocol::Json& payload, const Emit& emit) {
    const auto password = payload.find("password");
    const auto code = payload.find("totp");
    const bool well_formed = password != payload.end() && password->is_string() &&
                             (code == payload.end() || code->is_string());
    const std::string code_text = (code != payload.end() && code->is_string()) ? code->get<std::string>() : "";

    if (!well_formed || !verifier_.verify(password->get<std::string>(), code_text, clock_())) {
        ++session.stats().auth_failures;
        logger_.warn(session.tag() + " authentication failed from " + session.peer());
        throw AuthError(kAuthFailed);
    }
    session.mark_authenticated();
    logger_.info(session.tag() + " authenticated from " + session.peer());
    emit({{"type", protocol::kStatus}, {"status", "authenticated"}});
}

void SessionRouter::handle_text(Session& session, std::string_view text, const Emit& emit) {
    try {
        const auto message = protocol::parse_inbound(text);
        if (!message) {
            if (!session.authenticated()) {
                throw AuthError("Authentication required.");
            }
            throw ProtocolError("Message must be a JSON object.");
        }
        if (!session.authenticated()) {
            if (message->kind != protocol::InboundKind::kAuth) {
                throw AuthError("Authentication required.");
            }
            authenticate(session, message->payload, emit);
            return;
        }
        if (message->kind == protocol::InboundKind::kAuth) {
            throw ProtocolError("Session is already authenticated.");
        }
        logger_.debug(session.tag() + " " + message->type + " in " + workflow_name(session.workflow()));
        workflow_.handle(session, *message, emit);
    } catch (const BridgeError& ex) {
        if (ex.kind() == ErrorKind::kFatal) {
            logger_.error(session.tag() + " " + ex.what());
        }
        emit(error_message(ex.kind(), ex.what()));
    } catch (const std::exception& ex) {
        logger_.error(session.tag() + " unexpected failure: " + ex.what());
        emit(error_message(ErrorKind::kFatal, ex.what()));
    }
}

}  // namespace canvas::server
