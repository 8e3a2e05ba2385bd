#include "waypoint/agent/session_service.hpp"
#include "waypoint/core/uuid.hpp"

#include <spdlog/spdlog.h>

namespace waypoint::agent {

SessionService::SessionService(state::StateManager& state, state::ChatHistory& history, Orchestrator& orchestrator)
    : state_(state)
    , history_(history)
    , orchestrator_(orchestrator)
{
}

Result<SessionId, Error> SessionService::create_session() {
    SessionId id = generate_session_id();

    // An empty commit persists the template state
    auto created = state_.commit(id, Diff{});
    if (created.is_err()) {
        return Result<SessionId, Error>::err(std::move(created).error());
    }

    spdlog::info("Created session {}", id);
    return Result<SessionId, Error>::ok(id);
}

Result<State, Error> SessionService::resume(const SessionId& session_id) {
    if (session_id.empty()) {
        return Result<State, Error>::err(ErrorCode::InvalidArgument, "Session id is empty");
    }
    return state_.get_state(session_id);
}

Result<Response, Error> SessionService::submit(const SessionId& session_id,
                                               const std::string& message,
                                               StageCallback on_stage) {
    if (session_id.empty()) {
        return Result<Response, Error>::err(ErrorCode::InvalidArgument, "Session id is empty");
    }
    if (message.empty()) {
        return Result<Response, Error>::err(ErrorCode::InvalidArgument, "Message is empty", session_id);
    }
    return orchestrator_.process(session_id, message, std::move(on_stage));
}

Result<void, Error> SessionService::clear(const SessionId& session_id) {
    WAYPOINT_TRY_VOID(state_.clear(session_id));
    WAYPOINT_TRY_VOID(history_.clear(session_id));
    return Result<void, Error>::ok();
}

}  // namespace waypoint::agent
