#include "waypoint/state/diff_builder.hpp"
#include "waypoint/state/merge.hpp"

namespace waypoint::state {

Result<Diff, Error> DiffBuilder::propose(const Json& candidate) const {
    auto diff = Diff::from_json(candidate);
    if (diff.is_err()) {
        return diff;
    }
    auto valid = validate_diff(diff.value());
    if (valid.is_err()) {
        return Result<Diff, Error>::err(std::move(valid).error());
    }
    return diff;
}

Diff DiffBuilder::add_task(const Task& task) const {
    Diff diff;
    diff.add_task(TaskPatch::from_task(task));
    return diff;
}

Diff DiffBuilder::update_task_status(const TaskId& id, TaskStatus status) const {
    Diff diff;
    diff.add_task(TaskPatch::status_update(id, status));
    return diff;
}

Result<Diff, Error> DiffBuilder::annotate_task(const TaskId& id, const Json& metadata) const {
    if (id.empty()) {
        return Result<Diff, Error>::err(ErrorCode::DiffValidationFailed, "Task entry is missing task_id");
    }
    auto meta = Diff::from_json(metadata, false);
    if (meta.is_err()) {
        return meta;
    }

    TaskPatch patch;
    patch.task_id = id;
    patch.metadata = std::move(meta).value();

    Diff diff;
    diff.add_task(std::move(patch));
    return Result<Diff, Error>::ok(std::move(diff));
}

Result<Diff, Error> DiffBuilder::update_travel_info(const Json& updates) const {
    return section("travel_info", updates);
}

Result<Diff, Error> DiffBuilder::update_user_profile(const Json& updates) const {
    return section("user_profile", updates);
}

Result<Diff, Error> DiffBuilder::section(const std::string& name, const Json& updates) const {
    auto nested = Diff::from_json(updates, false);
    if (nested.is_err()) {
        auto error = std::move(nested).error();
        error.context = name;
        return Result<Diff, Error>::err(std::move(error));
    }

    Diff diff;
    diff.nest(name, std::move(nested).value());
    auto valid = diff.validate();
    if (valid.is_err()) {
        return Result<Diff, Error>::err(std::move(valid).error());
    }
    return Result<Diff, Error>::ok(std::move(diff));
}

Diff DiffBuilder::from_results(const std::vector<TaskResult>& results) const {
    Diff diff;
    for (const auto& result : results) {
        TaskPatch patch = TaskPatch::status_update(
            result.task_id,
            result.succeeded() ? TaskStatus::Done : TaskStatus::Failed
        );
        if (result.succeeded()) {
            patch.metadata.set("result", result.output);
        } else if (result.error) {
            patch.metadata.set("error", Json{
                {"code", static_cast<int>(result.error->code)},
                {"message", result.error->full_message()}
            });
        }
        diff.add_task(std::move(patch));
    }
    return diff;
}

}  // namespace waypoint::state
