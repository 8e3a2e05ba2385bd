#include "waypoint/state/state_model.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace waypoint::state {

std::optional<TaskStatus> task_status_from_string(std::string_view str) {
    if (str == "pending") return TaskStatus::Pending;
    if (str == "in_progress") return TaskStatus::InProgress;
    if (str == "done" || str == "completed") return TaskStatus::Done;
    if (str == "failed") return TaskStatus::Failed;
    return std::nullopt;
}

namespace {

int status_rank(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return 0;
        case TaskStatus::InProgress: return 1;
        case TaskStatus::Done:
        case TaskStatus::Failed: return 2;
    }
    return 0;
}

}  // namespace

bool is_valid_transition(TaskStatus from, TaskStatus to) {
    if (from == to) {
        return true;
    }
    return status_rank(to) > status_rank(from);
}

// Task
std::optional<ToolId> Task::tool() const {
    if (metadata.is_object() && metadata.contains("tool") && metadata["tool"].is_string()) {
        auto name = metadata["tool"].get<std::string>();
        if (!name.empty()) {
            return name;
        }
    }
    return std::nullopt;
}

Json Task::arguments() const {
    if (metadata.is_object() && metadata.contains("arguments") && metadata["arguments"].is_object()) {
        return metadata["arguments"];
    }
    return Json::object();
}

int Task::priority() const {
    if (metadata.is_object() && metadata.contains("priority") && metadata["priority"].is_number_integer()) {
        return metadata["priority"].get<int>();
    }
    return 0;
}

Json Task::to_json() const {
    return Json{
        {"task_id", task_id},
        {"timestamp", timestamp},
        {"agent_origin", agent_origin},
        {"intent", intent},
        {"status", std::string(task_status_to_string(status))},
        {"metadata", metadata}
    };
}

Result<Task, Error> Task::from_json(const Json& j) {
    if (!j.is_object()) {
        return Result<Task, Error>::err(ErrorCode::DiffValidationFailed, "Task entry must be an object");
    }
    if (!j.contains("task_id") || !j["task_id"].is_string() || j["task_id"].get<std::string>().empty()) {
        return Result<Task, Error>::err(ErrorCode::DiffValidationFailed, "Task entry is missing task_id");
    }

    Task task;
    task.task_id = j["task_id"].get<std::string>();
    task.timestamp = j.value("timestamp", "");
    task.agent_origin = j.value("agent_origin", "");
    task.intent = j.value("intent", "");

    auto status_str = j.value("status", "pending");
    auto status = task_status_from_string(status_str);
    if (!status) {
        return Result<Task, Error>::err(
            ErrorCode::DiffValidationFailed,
            "Unknown task status: " + status_str,
            task.task_id
        );
    }
    task.status = *status;

    if (j.contains("metadata") && j["metadata"].is_object()) {
        task.metadata = j["metadata"];
    }

    return Result<Task, Error>::ok(std::move(task));
}

// State
State::State()
    : doc_(Json{
          {"user_profile", Json::object()},
          {"tasks", Json::array()},
          {"travel_info", Json::object()}
      })
{
}

std::vector<Task> State::tasks() const {
    std::vector<Task> result;
    const auto& list = doc_.at("tasks");
    result.reserve(list.size());
    for (const auto& entry : list) {
        auto task = Task::from_json(entry);
        if (task.is_err()) {
            spdlog::warn("Skipping unreadable task entry: {}", task.error().full_message());
            continue;
        }
        result.push_back(std::move(task).value());
    }
    return result;
}

std::optional<Task> State::find_task(const TaskId& id) const {
    for (const auto& entry : doc_.at("tasks")) {
        if (entry.value("task_id", "") == id) {
            auto task = Task::from_json(entry);
            if (task.is_ok()) {
                return std::move(task).value();
            }
            spdlog::warn("Task {} is unreadable: {}", id, task.error().full_message());
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool State::has_task(const TaskId& id) const {
    for (const auto& entry : doc_.at("tasks")) {
        if (entry.value("task_id", "") == id) {
            return true;
        }
    }
    return false;
}

Result<State, Error> State::from_json(const Json& j) {
    if (!j.is_object()) {
        return Result<State, Error>::err(ErrorCode::StateCorrupted, "State document must be an object");
    }

    Json doc = j;
    for (const char* key : {"user_profile", "travel_info"}) {
        if (!doc.contains(key)) {
            doc[key] = Json::object();
        } else if (!doc[key].is_object()) {
            return Result<State, Error>::err(
                ErrorCode::StateCorrupted,
                "State field must be an object",
                key
            );
        }
    }

    if (!doc.contains("tasks")) {
        doc["tasks"] = Json::array();
    } else if (!doc["tasks"].is_array()) {
        return Result<State, Error>::err(ErrorCode::StateCorrupted, "State field must be an array", "tasks");
    }

    std::unordered_set<std::string> seen;
    for (const auto& entry : doc["tasks"]) {
        auto task = Task::from_json(entry);
        if (task.is_err()) {
            return Result<State, Error>::err(
                ErrorCode::StateCorrupted,
                task.error().message,
                task.error().context.value_or("tasks")
            );
        }
        if (!seen.insert(task.value().task_id).second) {
            return Result<State, Error>::err(
                ErrorCode::StateCorrupted,
                "Duplicate task_id",
                task.value().task_id
            );
        }
    }

    return Result<State, Error>::ok(State(std::move(doc)));
}

// TaskResult
Json TaskResult::to_json() const {
    Json j{
        {"task_id", task_id},
        {"status", std::string(task_status_to_string(status))},
        {"output", output},
        {"duration_ms", to_millis(duration)},
        {"attempts", attempts}
    };
    if (error) {
        j["error"] = Json{
            {"code", static_cast<int>(error->code)},
            {"message", error->full_message()}
        };
    }
    return j;
}

// TaskIteration
TaskIteration TaskIteration::make(int number, std::vector<Task> tasks,
                                  std::vector<TaskResult> results, Duration elapsed) {
    TaskIteration it;
    it.iteration_number = number;
    it.timestamp = now_timestamp();
    it.summary.total_count = static_cast<int>(results.size());
    for (const auto& r : results) {
        if (r.succeeded()) {
            ++it.summary.completed_count;
        } else {
            ++it.summary.failed_count;
        }
    }
    it.summary.elapsed = elapsed;
    it.tasks = std::move(tasks);
    it.results = std::move(results);
    return it;
}

Json TaskIteration::to_json() const {
    Json tasks_json = Json::array();
    for (const auto& t : tasks) {
        tasks_json.push_back(t.to_json());
    }
    Json results_json = Json::array();
    for (const auto& r : results) {
        results_json.push_back(r.to_json());
    }
    return Json{
        {"iteration_number", iteration_number},
        {"timestamp", timestamp},
        {"tasks", tasks_json},
        {"results", results_json},
        {"execution_summary", {
            {"total_count", summary.total_count},
            {"completed_count", summary.completed_count},
            {"failed_count", summary.failed_count},
            {"total_execution_time_ms", to_millis(summary.elapsed)}
        }}
    };
}

}  // namespace waypoint::state
