#pragma once

#include "waypoint/core/result.hpp"
#include "waypoint/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::state {

using namespace waypoint::core;

class Diff;

// Task lifecycle. Ordered: pending < in_progress < {done, failed}
enum class TaskStatus {
    Pending,
    InProgress,
    Done,
    Failed
};

inline std::string_view task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Done: return "done";
        case TaskStatus::Failed: return "failed";
    }
    return "pending";
}

// Accepts "completed" as a synonym for done
std::optional<TaskStatus> task_status_from_string(std::string_view str);

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Done || status == TaskStatus::Failed;
}

// True if a task may move from `from` to `to` in one commit.
// Staying put is allowed; moving backward or between the two terminal
// states is not.
bool is_valid_transition(TaskStatus from, TaskStatus to);

// One unit of user intent or planned work
struct Task {
    TaskId task_id;
    std::string timestamp;
    std::string agent_origin;
    std::string intent;
    TaskStatus status = TaskStatus::Pending;
    Json metadata = Json::object();

    // External call this task runs (metadata.tool / metadata.arguments)
    std::optional<ToolId> tool() const;
    Json arguments() const;

    // Dispatch priority, higher first (metadata.priority)
    int priority() const;

    Json to_json() const;
    static Result<Task, Error> from_json(const Json& j);
};

// Root aggregate for one session: user_profile, tasks, travel_info.
// Immutable once built; new states come out of the merge engine.
class State {
public:
    // Empty shape: {} / [] / {}
    State();

    const Json& user_profile() const { return doc_.at("user_profile"); }
    const Json& travel_info() const { return doc_.at("travel_info"); }
    const Json& tasks_json() const { return doc_.at("tasks"); }

    std::vector<Task> tasks() const;
    std::optional<Task> find_task(const TaskId& id) const;
    bool has_task(const TaskId& id) const;
    size_t task_count() const { return doc_.at("tasks").size(); }

    const Json& to_json() const { return doc_; }

    // Checks the top-level shape and the task list (objects with unique,
    // non-empty task_id and a known status)
    static Result<State, Error> from_json(const Json& j);

    bool operator==(const State& other) const { return doc_ == other.doc_; }
    bool operator!=(const State& other) const { return doc_ != other.doc_; }

private:
    explicit State(Json doc) : doc_(std::move(doc)) {}

    friend Result<State, Error> merge(const State& current, const Diff& diff);

    Json doc_;
};

// Outcome of one task's external call, correlated by task_id
struct TaskResult {
    TaskId task_id;
    TaskStatus status = TaskStatus::Failed;
    Json output;
    std::optional<Error> error;
    Duration duration{0};
    int attempts = 0;

    bool succeeded() const { return status == TaskStatus::Done; }

    Json to_json() const;
};

// One batch of tasks submitted together plus the executor's outcome
struct TaskIteration {
    int iteration_number = 0;
    std::string timestamp;
    std::vector<Task> tasks;
    std::vector<TaskResult> results;

    struct Summary {
        int total_count = 0;
        int completed_count = 0;
        int failed_count = 0;
        Duration elapsed{0};
    };
    Summary summary;

    static TaskIteration make(int number, std::vector<Task> tasks,
                              std::vector<TaskResult> results, Duration elapsed);

    Json to_json() const;
};

}  // namespace waypoint::state
