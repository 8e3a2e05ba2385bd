#pragma once

#include "waypoint/core/config.hpp"
#include "waypoint/core/result.hpp"
#include "waypoint/core/types.hpp"
#include "waypoint/state/chat_history.hpp"
#include "waypoint/state/state_manager.hpp"
#include "waypoint/tools/task_executor.hpp"
#include "waypoint/tools/tool_registry.hpp"
#include "sub_agents.hpp"

#include <functional>
#include <string>
#include <vector>

namespace waypoint::agent {

using namespace waypoint::core;

// Request stages, in the order they run
enum class Stage {
    Intake,
    Plan,
    Execute,
    Reflect,
    Finalize,
    Done,
    Failed
};

inline std::string_view stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::Intake: return "intake";
        case Stage::Plan: return "plan";
        case Stage::Execute: return "execute";
        case Stage::Reflect: return "reflect";
        case Stage::Finalize: return "finalize";
        case Stage::Done: return "done";
        case Stage::Failed: return "failed";
    }
    return "unknown";
}

// Emitted when a request enters a stage
struct StageEvent {
    Stage stage;
    SessionId session_id;
    int iteration = 0;
    std::string message;
};

using StageCallback = std::function<void(const StageEvent&)>;

// Everything one request carries between stages. Created when the request
// starts and dropped when it ends.
struct SessionContext {
    SessionId session_id;
    std::string message;
    State snapshot;
    Stage stage = Stage::Intake;
    IntakeOutput intake;
    std::vector<TaskId> pending;               // Tasks the next Execute runs
    std::vector<state::TaskIteration> iterations;
};

struct Response {
    SessionId session_id;
    std::string reply;
    bool needs_clarification = false;
    std::vector<state::TaskIteration> iterations;
    State state;

    Json to_json() const;
};

// Runs one user message through Intake -> Plan -> Execute -> Reflect ->
// Finalize. The only component that commits: every agent proposal goes
// through here, one commit per stage, in stage order.
class Orchestrator {
public:
    Orchestrator(
        const OrchestratorConfig& config,
        state::StateManager& state,
        state::ChatHistory& history,
        tools::TaskExecutor& executor,
        const tools::ToolRegistry& tools,
        AgentSet agents
    );

    // Any stage failure aborts the request; stages already committed stay
    // committed, nothing is partially merged.
    Result<Response, Error> process(
        const SessionId& session_id,
        const std::string& message,
        StageCallback on_stage = nullptr
    );

private:
    OrchestratorConfig config_;
    state::StateManager& state_;
    state::ChatHistory& history_;
    tools::TaskExecutor& executor_;
    const tools::ToolRegistry& tools_;
    AgentSet agents_;

    Result<void, Error> run_intake(SessionContext& ctx);
    Result<void, Error> run_plan(SessionContext& ctx);
    Result<void, Error> run_execute(SessionContext& ctx);
    Result<void, Error> run_reflect(SessionContext& ctx);
    Result<std::string, Error> run_finalize(SessionContext& ctx);

    // Commit and refresh ctx.snapshot. ConcurrencyTimeout is retried up to
    // commit_retries times.
    Result<void, Error> commit(SessionContext& ctx, const Diff& diff);

    // Tasks among `ids` that are pending in the current snapshot
    std::vector<TaskId> pending_among(const SessionContext& ctx, const std::vector<TaskId>& ids) const;

    void enter(SessionContext& ctx, Stage stage, const StageCallback& on_stage, std::string message = "");
};

}  // namespace waypoint::agent
