#pragma once

#include "waypoint/core/result.hpp"
#include "waypoint/core/types.hpp"
#include "waypoint/state/chat_history.hpp"
#include "waypoint/state/diff.hpp"
#include "waypoint/state/diff_builder.hpp"
#include "waypoint/state/state_model.hpp"

#include <string>
#include <vector>

namespace waypoint::agent {

using namespace waypoint::core;
using state::Diff;
using state::DiffBuilder;
using state::State;

// What every sub-agent hands back: its own output plus the state change it
// would like to see. Agents see a snapshot and a DiffBuilder only; they have
// no way to commit.
template<typename Output>
struct Proposal {
    Output output;
    Diff diff;
};

// Intake (root agent): records the user's intent as a new task
struct IntakeInput {
    SessionId session_id;
    std::string message;
    std::vector<state::ChatMessage> history;  // Most recent turns, oldest first
};

struct IntakeOutput {
    bool needs_clarification = false;
    std::string reply;       // Clarifying question when needs_clarification
    Json extracted_info = Json::object();
};

class IntakeAgent {
public:
    virtual ~IntakeAgent() = default;
    virtual Result<Proposal<IntakeOutput>, Error> propose(
        const State& snapshot, const IntakeInput& input, const DiffBuilder& builder) = 0;
};

// Planner: breaks the intent into tool-backed subtasks
struct PlanInput {
    std::string message;
    Json extracted_info = Json::object();
    Json tool_catalog = Json::array();
};

struct PlanOutput {
    Json task_structure = Json::object();
    std::string rationale;
};

class PlannerAgent {
public:
    virtual ~PlannerAgent() = default;
    virtual Result<Proposal<PlanOutput>, Error> propose(
        const State& snapshot, const PlanInput& input, const DiffBuilder& builder) = 0;
};

// Follower: reads execution results, annotates tasks and may plan follow-ups
struct ReflectInput {
    std::vector<state::TaskResult> results;
    int iteration = 0;
};

struct ReflectOutput {
    bool needs_additional_tasks = false;
    std::string reasoning;
};

class FollowerAgent {
public:
    virtual ~FollowerAgent() = default;
    virtual Result<Proposal<ReflectOutput>, Error> propose(
        const State& snapshot, const ReflectInput& input, const DiffBuilder& builder) = 0;
};

// Finalizer: closes out the request and writes the reply
struct FinalizeInput {
    std::string message;
    std::vector<state::TaskIteration> iterations;
};

struct FinalizeOutput {
    std::string summary;
};

class FinalizerAgent {
public:
    virtual ~FinalizerAgent() = default;
    virtual Result<Proposal<FinalizeOutput>, Error> propose(
        const State& snapshot, const FinalizeInput& input, const DiffBuilder& builder) = 0;
};

struct AgentSet {
    IntakeAgent& intake;
    PlannerAgent& planner;
    FollowerAgent& follower;
    FinalizerAgent& finalizer;
};

}  // namespace waypoint::agent
