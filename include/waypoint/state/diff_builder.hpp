#pragma once

#include "diff.hpp"
#include "state_model.hpp"

#include <vector>

namespace waypoint::state {

// Shapes valid diffs. Never touches canonical state or the store, so it is
// safe to hand to any sub-agent.
class DiffBuilder {
public:
    // Diff from a JSON candidate ({"travel_info": {...}, "tasks": [...]}).
    // The result has passed validate_diff.
    Result<Diff, Error> propose(const Json& candidate) const;

    // Append (or fully restate) a task
    Diff add_task(const Task& task) const;

    Diff update_task_status(const TaskId& id, TaskStatus status) const;

    // Merge `metadata` (a mapping) into a task's metadata
    Result<Diff, Error> annotate_task(const TaskId& id, const Json& metadata) const;

    // Merge `updates` (a mapping) into one state section
    Result<Diff, Error> update_travel_info(const Json& updates) const;
    Result<Diff, Error> update_user_profile(const Json& updates) const;

    // Fold executor results into task updates: status done/failed plus
    // metadata.result or metadata.error
    Diff from_results(const std::vector<TaskResult>& results) const;

private:
    Result<Diff, Error> section(const std::string& name, const Json& updates) const;
};

}  // namespace waypoint::state
