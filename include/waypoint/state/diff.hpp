#pragma once

#include "state_model.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace waypoint::state {

class Diff;
struct TaskPatch;

// Partial tasks keyed by task_id, applied in list order
using TaskListDiff = std::vector<TaskPatch>;

// One field of a Diff. The kind decides the merge rule:
//   Value    - replaces the current value (scalars, sequences, whole objects)
//   Nested   - merged recursively into the current mapping
//   TaskList - reconciled element-wise by task_id
class DiffNode {
public:
    enum class Kind {
        Value,
        Nested,
        TaskList
    };

    static DiffNode value(Json v);
    static DiffNode nested(Diff d);
    static DiffNode task_list(TaskListDiff patches);

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    const Json& as_value() const { return std::get<0>(data_); }
    const Diff& as_nested() const { return *std::get<1>(data_); }
    const TaskListDiff& as_task_list() const { return *std::get<2>(data_); }

private:
    DiffNode() = default;

    std::variant<Json, std::shared_ptr<const Diff>, std::shared_ptr<const TaskListDiff>> data_;
};

// A proposed state change: pure data, never applied by whoever builds it
class Diff {
public:
    using Fields = std::map<std::string, DiffNode>;

    Diff() = default;

    // Builders (replace any node already under the key)
    Diff& set(const std::string& key, Json value);
    Diff& nest(const std::string& key, Diff nested);
    Diff& set_tasks(const std::string& key, TaskListDiff patches);

    // Append a task patch to the top-level "tasks" list
    Diff& add_task(TaskPatch patch);

    bool empty() const { return fields_.empty(); }
    size_t size() const { return fields_.size(); }
    const Fields& fields() const { return fields_; }
    const DiffNode* find(const std::string& key) const;

    // task_ids named by the top-level "tasks" list, in order, without repeats
    std::vector<TaskId> task_ids() const;

    // Combine two diffs; `top` wins where both touch the same field.
    // Nested diffs combine recursively. Task patches for the same task_id
    // fold into one, other patches are appended.
    Diff overlay(const Diff& top) const;

    // Every task patch at any depth carries a non-empty task_id
    Result<void, Error> validate() const;

    Json to_json() const;

    // Objects become nested diffs, everything else is a value. With
    // `top_level`, an array under the "tasks" key becomes a task list.
    static Result<Diff, Error> from_json(const Json& j, bool top_level = true);

    bool operator==(const Diff& other) const { return to_json() == other.to_json(); }

private:
    Fields fields_;
};

// Partial Task. Only task_id is required; absent fields are left alone.
struct TaskPatch {
    TaskId task_id;
    std::optional<std::string> timestamp;
    std::optional<std::string> agent_origin;
    std::optional<std::string> intent;
    std::optional<TaskStatus> status;
    Diff metadata;

    // Patch carrying every field of a full task
    static TaskPatch from_task(const Task& task);

    static TaskPatch status_update(const TaskId& id, TaskStatus status);

    // Fields set in `top` replace ours; metadata overlays
    TaskPatch overlay(const TaskPatch& top) const;

    Json to_json() const;
    static Result<TaskPatch, Error> from_json(const Json& j);
};

inline DiffNode DiffNode::value(Json v) {
    DiffNode node;
    node.data_.emplace<0>(std::move(v));
    return node;
}

inline DiffNode DiffNode::nested(Diff d) {
    DiffNode node;
    node.data_.emplace<1>(std::make_shared<const Diff>(std::move(d)));
    return node;
}

inline DiffNode DiffNode::task_list(TaskListDiff patches) {
    DiffNode node;
    node.data_.emplace<2>(std::make_shared<const TaskListDiff>(std::move(patches)));
    return node;
}

}  // namespace waypoint::state
