#include "waypoint/agent/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace waypoint::agent {

namespace {

// Run an agent, turning a thrown exception into AgentFailed and tagging
// errors with the agent that produced them
template<typename F>
auto call_agent(AgentRole role, F&& f) -> decltype(f()) {
    using R = decltype(f());
    const std::string name(agent_role_to_string(role));
    try {
        auto result = f();
        if (result.is_err()) {
            auto error = std::move(result).error();
            if (!error.source) {
                error.source = name;
            }
            return R::err(std::move(error));
        }
        return result;
    } catch (const std::exception& e) {
        Error error{ErrorCode::AgentFailed, e.what()};
        error.source = name;
        return R::err(std::move(error));
    }
}

}  // namespace

// Response
Json Response::to_json() const {
    Json iterations_json = Json::array();
    for (const auto& it : iterations) {
        iterations_json.push_back(it.to_json());
    }
    return Json{
        {"session_id", session_id},
        {"reply", reply},
        {"needs_clarification", needs_clarification},
        {"iterations", iterations_json},
        {"state", state.to_json()}
    };
}

// Orchestrator
Orchestrator::Orchestrator(
    const OrchestratorConfig& config,
    state::StateManager& state,
    state::ChatHistory& history,
    tools::TaskExecutor& executor,
    const tools::ToolRegistry& tools,
    AgentSet agents)
    : config_(config)
    , state_(state)
    , history_(history)
    , executor_(executor)
    , tools_(tools)
    , agents_(agents)
{
}

void Orchestrator::enter(SessionContext& ctx, Stage stage, const StageCallback& on_stage, std::string message) {
    ctx.stage = stage;
    spdlog::debug("Session {} -> {}", ctx.session_id, stage_to_string(stage));
    if (on_stage) {
        on_stage(StageEvent{
            .stage = stage,
            .session_id = ctx.session_id,
            .iteration = static_cast<int>(ctx.iterations.size()),
            .message = std::move(message)
        });
    }
}

Result<void, Error> Orchestrator::commit(SessionContext& ctx, const Diff& diff) {
    for (int attempt = 0; ; ++attempt) {
        auto committed = state_.commit(ctx.session_id, diff);
        if (committed.is_ok()) {
            ctx.snapshot = std::move(committed).value();
            return Result<void, Error>::ok();
        }

        auto error = std::move(committed).error();
        if (error.code != ErrorCode::ConcurrencyTimeout || attempt >= config_.commit_retries) {
            error.source = std::string(stage_to_string(ctx.stage));
            return Result<void, Error>::err(std::move(error));
        }

        spdlog::warn("Commit for session {} timed out in {}, retry {}/{}",
                     ctx.session_id, stage_to_string(ctx.stage), attempt + 1, config_.commit_retries);
        std::this_thread::sleep_for(Duration{config_.commit_retry_backoff_ms * (attempt + 1)});
    }
}

std::vector<TaskId> Orchestrator::pending_among(const SessionContext& ctx, const std::vector<TaskId>& ids) const {
    std::vector<TaskId> pending;
    for (const auto& id : ids) {
        auto task = ctx.snapshot.find_task(id);
        if (task && task->status == state::TaskStatus::Pending) {
            pending.push_back(id);
        }
    }
    return pending;
}

Result<void, Error> Orchestrator::run_intake(SessionContext& ctx) {
    auto loaded = state_.load(ctx.session_id);
    if (loaded.is_err()) {
        return Result<void, Error>::err(std::move(loaded).error());
    }
    ctx.snapshot = std::move(loaded).value();

    IntakeInput input;
    input.session_id = ctx.session_id;
    input.message = ctx.message;

    auto history = history_.recent(ctx.session_id, static_cast<size_t>(config_.history_turns));
    if (history.is_ok()) {
        input.history = std::move(history).value();
    } else {
        spdlog::warn("Chat history unavailable for {}: {}", ctx.session_id, history.error().full_message());
    }

    auto proposal = call_agent(AgentRole::Root, [&] {
        return agents_.intake.propose(ctx.snapshot, input, state_.diff_builder());
    });
    if (proposal.is_err()) {
        return Result<void, Error>::err(std::move(proposal).error());
    }

    auto& p = proposal.value();
    ctx.intake = std::move(p.output);
    return commit(ctx, p.diff);
}

Result<void, Error> Orchestrator::run_plan(SessionContext& ctx) {
    PlanInput input;
    input.message = ctx.message;
    input.extracted_info = ctx.intake.extracted_info;
    input.tool_catalog = tools_.catalog();

    auto proposal = call_agent(AgentRole::Planner, [&] {
        return agents_.planner.propose(ctx.snapshot, input, state_.diff_builder());
    });
    if (proposal.is_err()) {
        return Result<void, Error>::err(std::move(proposal).error());
    }

    const auto& p = proposal.value();
    WAYPOINT_TRY_VOID(commit(ctx, p.diff));

    ctx.pending = pending_among(ctx, p.diff.task_ids());
    spdlog::info("Session {}: planned {} task(s)", ctx.session_id, ctx.pending.size());
    return Result<void, Error>::ok();
}

Result<void, Error> Orchestrator::run_execute(SessionContext& ctx) {
    std::vector<state::Task> batch;
    batch.reserve(ctx.pending.size());
    for (const auto& id : ctx.pending) {
        if (auto task = ctx.snapshot.find_task(id)) {
            batch.push_back(std::move(*task));
        }
    }
    ctx.pending.clear();

    if (!batch.empty()) {
        Diff started;
        for (const auto& task : batch) {
            started.add_task(state::TaskPatch::status_update(task.task_id, state::TaskStatus::InProgress));
        }
        WAYPOINT_TRY_VOID(commit(ctx, started));
    }

    auto start = SteadyClock::now();
    auto results = executor_.run(batch);
    auto elapsed = std::chrono::duration_cast<Duration>(SteadyClock::now() - start);

    ctx.iterations.push_back(state::TaskIteration::make(
        static_cast<int>(ctx.iterations.size()) + 1,
        std::move(batch),
        std::move(results),
        elapsed
    ));
    return Result<void, Error>::ok();
}

Result<void, Error> Orchestrator::run_reflect(SessionContext& ctx) {
    const auto& latest = ctx.iterations.back();

    ReflectInput input;
    input.results = latest.results;
    input.iteration = latest.iteration_number;

    auto proposal = call_agent(AgentRole::Follower, [&] {
        return agents_.follower.propose(ctx.snapshot, input, state_.diff_builder());
    });
    if (proposal.is_err()) {
        return Result<void, Error>::err(std::move(proposal).error());
    }

    const auto& p = proposal.value();
    Diff combined = state_.diff_builder().from_results(latest.results).overlay(p.diff);
    WAYPOINT_TRY_VOID(commit(ctx, combined));

    ctx.pending = pending_among(ctx, p.diff.task_ids());
    if (!ctx.pending.empty()) {
        spdlog::info("Session {}: follower added {} task(s) ({})",
                     ctx.session_id, ctx.pending.size(), p.output.reasoning);
    }
    return Result<void, Error>::ok();
}

Result<std::string, Error> Orchestrator::run_finalize(SessionContext& ctx) {
    FinalizeInput input;
    input.message = ctx.message;
    input.iterations = ctx.iterations;

    auto proposal = call_agent(AgentRole::Finalizer, [&] {
        return agents_.finalizer.propose(ctx.snapshot, input, state_.diff_builder());
    });
    if (proposal.is_err()) {
        return Result<std::string, Error>::err(std::move(proposal).error());
    }

    auto& p = proposal.value();
    auto committed = commit(ctx, p.diff);
    if (committed.is_err()) {
        return Result<std::string, Error>::err(std::move(committed).error());
    }
    return Result<std::string, Error>::ok(std::move(p.output.summary));
}

Result<Response, Error> Orchestrator::process(
    const SessionId& session_id,
    const std::string& message,
    StageCallback on_stage)
{
    SessionContext ctx;
    ctx.session_id = session_id;
    ctx.message = message;

    auto fail = [&](Error error) {
        spdlog::error("Session {} failed in {}: {}",
                      session_id, stage_to_string(ctx.stage), error.full_message());
        enter(ctx, Stage::Failed, on_stage, error.full_message());
        return Result<Response, Error>::err(std::move(error));
    };

    Response response;
    response.session_id = session_id;

    enter(ctx, Stage::Intake, on_stage);
    auto intake = run_intake(ctx);
    if (intake.is_err()) {
        return fail(std::move(intake).error());
    }

    if (ctx.intake.needs_clarification) {
        response.needs_clarification = true;
        response.reply = ctx.intake.reply;
    } else {
        enter(ctx, Stage::Plan, on_stage);
        auto planned = run_plan(ctx);
        if (planned.is_err()) {
            return fail(std::move(planned).error());
        }

        int rounds = 0;
        do {
            enter(ctx, Stage::Execute, on_stage);
            auto executed = run_execute(ctx);
            if (executed.is_err()) {
                return fail(std::move(executed).error());
            }

            enter(ctx, Stage::Reflect, on_stage);
            auto reflected = run_reflect(ctx);
            if (reflected.is_err()) {
                return fail(std::move(reflected).error());
            }
            ++rounds;
        } while (!ctx.pending.empty() && rounds < config_.max_iterations);

        if (!ctx.pending.empty()) {
            spdlog::warn("Session {}: {} task(s) left pending after {} round(s)",
                         session_id, ctx.pending.size(), rounds);
        }

        enter(ctx, Stage::Finalize, on_stage);
        auto summary = run_finalize(ctx);
        if (summary.is_err()) {
            return fail(std::move(summary).error());
        }
        response.reply = std::move(summary).value();
    }

    enter(ctx, Stage::Done, on_stage);

    auto recorded = history_.append_exchange(session_id, message, response.reply);
    if (recorded.is_err()) {
        spdlog::error("Failed to record chat history for {}: {}", session_id, recorded.error().full_message());
    }

    response.iterations = std::move(ctx.iterations);
    response.state = std::move(ctx.snapshot);
    return Result<Response, Error>::ok(std::move(response));
}

}  // namespace waypoint::agent
