#include "waypoint/state/diff.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace waypoint::state {

namespace {

const std::unordered_set<std::string>& known_task_fields() {
    static const std::unordered_set<std::string> fields{
        "task_id", "timestamp", "agent_origin", "intent", "status", "metadata"
    };
    return fields;
}

}  // namespace

// Diff
Diff& Diff::set(const std::string& key, Json value) {
    fields_.insert_or_assign(key, DiffNode::value(std::move(value)));
    return *this;
}

Diff& Diff::nest(const std::string& key, Diff nested) {
    fields_.insert_or_assign(key, DiffNode::nested(std::move(nested)));
    return *this;
}

Diff& Diff::set_tasks(const std::string& key, TaskListDiff patches) {
    fields_.insert_or_assign(key, DiffNode::task_list(std::move(patches)));
    return *this;
}

Diff& Diff::add_task(TaskPatch patch) {
    TaskListDiff patches;
    auto it = fields_.find("tasks");
    if (it != fields_.end() && it->second.kind() == DiffNode::Kind::TaskList) {
        patches = it->second.as_task_list();
    }
    patches.push_back(std::move(patch));
    return set_tasks("tasks", std::move(patches));
}

const DiffNode* Diff::find(const std::string& key) const {
    auto it = fields_.find(key);
    return it == fields_.end() ? nullptr : &it->second;
}

std::vector<TaskId> Diff::task_ids() const {
    std::vector<TaskId> ids;
    const auto* node = find("tasks");
    if (!node || node->kind() != DiffNode::Kind::TaskList) {
        return ids;
    }
    for (const auto& patch : node->as_task_list()) {
        if (std::find(ids.begin(), ids.end(), patch.task_id) == ids.end()) {
            ids.push_back(patch.task_id);
        }
    }
    return ids;
}

Diff Diff::overlay(const Diff& top) const {
    Diff result = *this;
    for (const auto& [key, node] : top.fields_) {
        auto it = result.fields_.find(key);
        if (it == result.fields_.end()) {
            result.fields_.insert_or_assign(key, node);
            continue;
        }

        const auto& base = it->second;
        if (base.kind() == DiffNode::Kind::Nested && node.kind() == DiffNode::Kind::Nested) {
            it->second = DiffNode::nested(base.as_nested().overlay(node.as_nested()));
        } else if (base.kind() == DiffNode::Kind::TaskList && node.kind() == DiffNode::Kind::TaskList) {
            TaskListDiff combined = base.as_task_list();
            for (const auto& patch : node.as_task_list()) {
                auto same = std::find_if(combined.rbegin(), combined.rend(), [&patch](const TaskPatch& p) {
                    return p.task_id == patch.task_id;
                });
                if (same == combined.rend()) {
                    combined.push_back(patch);
                } else {
                    *same = same->overlay(patch);
                }
            }
            it->second = DiffNode::task_list(std::move(combined));
        } else {
            it->second = node;
        }
    }
    return result;
}

Result<void, Error> Diff::validate() const {
    std::deque<const Diff*> pending{this};
    while (!pending.empty()) {
        const Diff* current = pending.front();
        pending.pop_front();

        for (const auto& [key, node] : current->fields_) {
            switch (node.kind()) {
                case DiffNode::Kind::Value:
                    break;
                case DiffNode::Kind::Nested:
                    pending.push_back(&node.as_nested());
                    break;
                case DiffNode::Kind::TaskList:
                    for (const auto& patch : node.as_task_list()) {
                        if (patch.task_id.empty()) {
                            return Result<void, Error>::err(
                                ErrorCode::DiffValidationFailed,
                                "Task entry is missing task_id",
                                key
                            );
                        }
                        pending.push_back(&patch.metadata);
                    }
                    break;
            }
        }
    }
    return Result<void, Error>::ok();
}

Json Diff::to_json() const {
    Json j = Json::object();
    for (const auto& [key, node] : fields_) {
        switch (node.kind()) {
            case DiffNode::Kind::Value:
                j[key] = node.as_value();
                break;
            case DiffNode::Kind::Nested:
                j[key] = node.as_nested().to_json();
                break;
            case DiffNode::Kind::TaskList: {
                Json list = Json::array();
                for (const auto& patch : node.as_task_list()) {
                    list.push_back(patch.to_json());
                }
                j[key] = std::move(list);
                break;
            }
        }
    }
    return j;
}

Result<Diff, Error> Diff::from_json(const Json& j, bool top_level) {
    if (!j.is_object()) {
        return Result<Diff, Error>::err(ErrorCode::DiffValidationFailed, "Diff must be a JSON object");
    }

    Diff diff;
    for (const auto& [key, value] : j.items()) {
        if (top_level && key == "tasks" && value.is_array()) {
            TaskListDiff patches;
            patches.reserve(value.size());
            for (const auto& entry : value) {
                auto patch = TaskPatch::from_json(entry);
                if (patch.is_err()) {
                    return Result<Diff, Error>::err(std::move(patch).error());
                }
                patches.push_back(std::move(patch).value());
            }
            diff.set_tasks(key, std::move(patches));
        } else if (value.is_object()) {
            auto nested = from_json(value, false);
            if (nested.is_err()) {
                return nested;
            }
            diff.nest(key, std::move(nested).value());
        } else {
            diff.set(key, value);
        }
    }
    return Result<Diff, Error>::ok(std::move(diff));
}

// TaskPatch
TaskPatch TaskPatch::from_task(const Task& task) {
    TaskPatch patch;
    patch.task_id = task.task_id;
    patch.timestamp = task.timestamp;
    patch.agent_origin = task.agent_origin;
    patch.intent = task.intent;
    patch.status = task.status;
    for (const auto& [key, value] : task.metadata.items()) {
        patch.metadata.set(key, value);
    }
    return patch;
}

TaskPatch TaskPatch::status_update(const TaskId& id, TaskStatus status) {
    TaskPatch patch;
    patch.task_id = id;
    patch.status = status;
    return patch;
}

TaskPatch TaskPatch::overlay(const TaskPatch& top) const {
    TaskPatch result = *this;
    if (top.timestamp) result.timestamp = top.timestamp;
    if (top.agent_origin) result.agent_origin = top.agent_origin;
    if (top.intent) result.intent = top.intent;
    if (top.status) result.status = top.status;
    result.metadata = metadata.overlay(top.metadata);
    return result;
}

Json TaskPatch::to_json() const {
    Json j{{"task_id", task_id}};
    if (timestamp) j["timestamp"] = *timestamp;
    if (agent_origin) j["agent_origin"] = *agent_origin;
    if (intent) j["intent"] = *intent;
    if (status) j["status"] = std::string(task_status_to_string(*status));
    if (!metadata.empty()) j["metadata"] = metadata.to_json();
    return j;
}

Result<TaskPatch, Error> TaskPatch::from_json(const Json& j) {
    if (!j.is_object()) {
        return Result<TaskPatch, Error>::err(ErrorCode::DiffValidationFailed, "Task entry must be an object");
    }
    if (!j.contains("task_id") || !j["task_id"].is_string() || j["task_id"].get<std::string>().empty()) {
        return Result<TaskPatch, Error>::err(ErrorCode::DiffValidationFailed, "Task entry is missing task_id");
    }

    TaskPatch patch;
    patch.task_id = j["task_id"].get<std::string>();

    for (const auto& [key, value] : j.items()) {
        if (!known_task_fields().count(key)) {
            return Result<TaskPatch, Error>::err(
                ErrorCode::DiffValidationFailed,
                "Unknown task field: " + key,
                patch.task_id
            );
        }
    }

    auto string_field = [&j](const char* name) -> Result<std::optional<std::string>, Error> {
        if (!j.contains(name)) {
            return Result<std::optional<std::string>, Error>::ok(std::nullopt);
        }
        if (!j[name].is_string()) {
            return Result<std::optional<std::string>, Error>::err(
                ErrorCode::DiffValidationFailed,
                std::string("Task field must be a string: ") + name
            );
        }
        return Result<std::optional<std::string>, Error>::ok(j[name].get<std::string>());
    };

    auto timestamp = string_field("timestamp");
    auto agent_origin = string_field("agent_origin");
    auto intent = string_field("intent");
    auto status = string_field("status");
    for (auto* field : {&timestamp, &agent_origin, &intent, &status}) {
        if (field->is_err()) {
            auto error = field->error();
            error.context = patch.task_id;
            return Result<TaskPatch, Error>::err(std::move(error));
        }
    }

    patch.timestamp = timestamp.value();
    patch.agent_origin = agent_origin.value();
    patch.intent = intent.value();

    if (status.value()) {
        auto parsed = task_status_from_string(*status.value());
        if (!parsed) {
            return Result<TaskPatch, Error>::err(
                ErrorCode::DiffValidationFailed,
                "Unknown task status: " + *status.value(),
                patch.task_id
            );
        }
        patch.status = *parsed;
    }

    if (j.contains("metadata")) {
        auto meta = Diff::from_json(j["metadata"], false);
        if (meta.is_err()) {
            auto error = std::move(meta).error();
            error.context = patch.task_id;
            return Result<TaskPatch, Error>::err(std::move(error));
        }
        patch.metadata = std::move(meta).value();
    }

    return Result<TaskPatch, Error>::ok(std::move(patch));
}

}  // namespace waypoint::state
