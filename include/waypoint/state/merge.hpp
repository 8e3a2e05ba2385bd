#pragma once

#include "diff.hpp"
#include "state_model.hpp"

namespace waypoint::state {

// Shape checks a diff must pass before it can be merged: only the
// user_profile, tasks and travel_info sections, "tasks" as a task list,
// and every task patch carrying a task_id.
Result<void, Error> validate_diff(const Diff& diff);

// Combine `current` with `diff` into a new State. Pure and deterministic.
//
//   - value nodes replace, sequences included (never concatenated)
//   - nested diffs merge recursively; a non-mapping target becomes {} first
//   - task lists reconcile by task_id: known ids merge field by field,
//     unknown ids append in diff order (status defaults to pending)
//   - a status that moves backward, or between done and failed, fails the
//     whole merge with InvalidStatusTransition
//
// merge(merge(s, d), d) == merge(s, d) for every valid d.
Result<State, Error> merge(const State& current, const Diff& diff);

}  // namespace waypoint::state
