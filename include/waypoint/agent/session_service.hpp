#pragma once

#include "orchestrator.hpp"

namespace waypoint::agent {

// Session lifecycle exposed to whatever transport sits on top
class SessionService {
public:
    SessionService(state::StateManager& state, state::ChatHistory& history, Orchestrator& orchestrator);

    // New session with its template state persisted
    Result<SessionId, Error> create_session();

    // Current state of an existing or new session
    Result<State, Error> resume(const SessionId& session_id);

    Result<Response, Error> submit(const SessionId& session_id,
                                   const std::string& message,
                                   StageCallback on_stage = nullptr);

    // Drop both the state and the chat history
    Result<void, Error> clear(const SessionId& session_id);

private:
    state::StateManager& state_;
    state::ChatHistory& history_;
    Orchestrator& orchestrator_;
};

}  // namespace waypoint::agent
