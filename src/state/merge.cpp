#include "waypoint/state/merge.hpp"

#include <unordered_map>
#include <vector>

namespace waypoint::state {

namespace {

// One pending unit of work: apply `diff` onto the mapping at `target`.
// Frames are processed depth-first so that every frame finishes its subtree
// before any later frame can touch the same containers.
struct Frame {
    Json* target;
    const Diff* diff;
    std::string path;
};

std::string join_path(const std::string& base, const std::string& key) {
    return base.empty() ? key : base + "." + key;
}

Json new_task_entry(const TaskId& id) {
    return Json{
        {"task_id", id},
        {"timestamp", ""},
        {"agent_origin", ""},
        {"intent", ""},
        {"status", std::string(task_status_to_string(TaskStatus::Pending))},
        {"metadata", Json::object()}
    };
}

// Reconcile a task list by task_id. Indices are resolved (and new entries
// appended) before any field is written, so the element addresses handed to
// metadata frames stay valid.
Result<void, Error> merge_task_list(Json& list,
                                    const TaskListDiff& patches,
                                    const std::string& path,
                                    std::vector<Frame>& children) {
    if (!list.is_array()) {
        list = Json::array();
    }

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < list.size(); ++i) {
        if (list[i].is_object() && list[i].contains("task_id") && list[i]["task_id"].is_string()) {
            index.emplace(list[i]["task_id"].get<std::string>(), i);
        }
    }

    std::vector<size_t> targets;
    targets.reserve(patches.size());
    for (const auto& patch : patches) {
        auto it = index.find(patch.task_id);
        if (it == index.end()) {
            list.push_back(new_task_entry(patch.task_id));
            it = index.emplace(patch.task_id, list.size() - 1).first;
        }
        targets.push_back(it->second);
    }

    for (size_t i = 0; i < patches.size(); ++i) {
        const auto& patch = patches[i];
        Json& entry = list[targets[i]];

        if (patch.status) {
            auto current = task_status_from_string(entry.value("status", "pending"))
                               .value_or(TaskStatus::Pending);
            if (!is_valid_transition(current, *patch.status)) {
                return Result<void, Error>::err(
                    ErrorCode::InvalidStatusTransition,
                    std::string("Task status cannot move from ") +
                        std::string(task_status_to_string(current)) + " to " +
                        std::string(task_status_to_string(*patch.status)),
                    join_path(path, patch.task_id)
                );
            }
            entry["status"] = std::string(task_status_to_string(*patch.status));
        }
        if (patch.timestamp) entry["timestamp"] = *patch.timestamp;
        if (patch.agent_origin) entry["agent_origin"] = *patch.agent_origin;
        if (patch.intent) entry["intent"] = *patch.intent;

        if (!patch.metadata.empty()) {
            Json& metadata = entry["metadata"];
            if (!metadata.is_object()) {
                metadata = Json::object();
            }
            children.push_back(Frame{
                &metadata,
                &patch.metadata,
                join_path(path, patch.task_id + ".metadata")
            });
        }
    }

    return Result<void, Error>::ok();
}

// The per-kind merge rule for one field of one frame
Result<void, Error> apply_node(Json& target,
                               const std::string& key,
                               const DiffNode& node,
                               const std::string& path,
                               std::vector<Frame>& children) {
    switch (node.kind()) {
        case DiffNode::Kind::Value:
            target[key] = node.as_value();
            return Result<void, Error>::ok();

        case DiffNode::Kind::Nested: {
            Json& child = target[key];
            if (!child.is_object()) {
                child = Json::object();
            }
            children.push_back(Frame{&child, &node.as_nested(), join_path(path, key)});
            return Result<void, Error>::ok();
        }

        case DiffNode::Kind::TaskList:
            return merge_task_list(target[key], node.as_task_list(), join_path(path, key), children);
    }
    return Result<void, Error>::ok();
}

}  // namespace

Result<void, Error> validate_diff(const Diff& diff) {
    for (const auto& [key, node] : diff.fields()) {
        if (key == "tasks") {
            if (node.kind() != DiffNode::Kind::TaskList) {
                return Result<void, Error>::err(
                    ErrorCode::DiffValidationFailed,
                    "tasks must be a list of task entries",
                    key
                );
            }
        } else if (key == "user_profile" || key == "travel_info") {
            if (node.kind() == DiffNode::Kind::Value && !node.as_value().is_object()) {
                return Result<void, Error>::err(
                    ErrorCode::DiffValidationFailed,
                    "Section must be a mapping",
                    key
                );
            }
            if (node.kind() == DiffNode::Kind::TaskList) {
                return Result<void, Error>::err(
                    ErrorCode::DiffValidationFailed,
                    "Section must be a mapping",
                    key
                );
            }
        } else {
            return Result<void, Error>::err(
                ErrorCode::DiffValidationFailed,
                "Unknown state section: " + key,
                key
            );
        }
    }
    return diff.validate();
}

Result<State, Error> merge(const State& current, const Diff& diff) {
    auto valid = validate_diff(diff);
    if (valid.is_err()) {
        return Result<State, Error>::err(std::move(valid).error());
    }

    Json doc = current.doc_;
    std::vector<Frame> stack;
    stack.push_back(Frame{&doc, &diff, ""});

    std::vector<Frame> children;
    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();

        children.clear();
        for (const auto& [key, node] : frame.diff->fields()) {
            auto applied = apply_node(*frame.target, key, node, frame.path, children);
            if (applied.is_err()) {
                return Result<State, Error>::err(std::move(applied).error());
            }
        }

        // Reverse so children pop in the order they were produced
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(std::move(*it));
        }
    }

    return Result<State, Error>::ok(State(std::move(doc)));
}

}  // namespace waypoint::state
