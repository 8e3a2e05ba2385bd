#include "waypoint/tools/task_executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <memory>
#include <numeric>
#include <thread>

namespace waypoint::tools {

namespace {

using state::TaskStatus;

enum class Phase {
    Queued,
    Running,
    Finished,
    Abandoned   // timed out; a late result is dropped
};

struct Slot {
    Phase phase = Phase::Queued;
    SteadyClock::time_point started;
    Duration timeout{0};
    TaskResult result;
};

// Shared between run() and the worker jobs; a job can outlive its run()
struct BatchState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Slot> slots;
    size_t remaining = 0;
};

Duration since(SteadyClock::time_point start) {
    return std::chrono::duration_cast<Duration>(SteadyClock::now() - start);
}

TaskResult failed(const Task& task, Error error, Duration duration = Duration{0}, int attempts = 0) {
    TaskResult result;
    result.task_id = task.task_id;
    result.status = TaskStatus::Failed;
    result.error = std::move(error);
    result.duration = duration;
    result.attempts = attempts;
    return result;
}

bool abandoned(BatchState& batch, size_t index) {
    std::lock_guard<std::mutex> lock(batch.mutex);
    return batch.slots[index].phase == Phase::Abandoned;
}

// Body of one worker job: call the tool, retrying retriable failures while
// the task's own timeout still has room for another attempt
void run_task(const ToolRegistry& registry,
              const ExecutorConfig& config,
              const std::shared_ptr<BatchState>& batch,
              size_t index,
              const Task& task,
              const ToolId& tool) {
    SteadyClock::time_point started;
    Duration timeout;
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        auto& slot = batch->slots[index];
        if (slot.phase == Phase::Abandoned) {
            return;
        }
        slot.phase = Phase::Running;
        slot.started = SteadyClock::now();
        started = slot.started;
        timeout = slot.timeout;
    }
    batch->cv.notify_all();

    const Duration backoff{config.retry_backoff_ms};
    const Json arguments = task.arguments();

    TaskResult result;
    result.task_id = task.task_id;

    while (true) {
        ++result.attempts;
        auto output = registry.execute(tool, arguments);

        if (output.is_ok()) {
            result.status = TaskStatus::Done;
            result.output = std::move(output).value();
            result.error.reset();
            break;
        }

        result.status = TaskStatus::Failed;
        result.error = std::move(output).error();

        if (!result.error->is_retriable() || result.attempts >= config.max_retries) {
            break;
        }
        if (since(started) + backoff >= timeout || abandoned(*batch, index)) {
            break;
        }

        spdlog::debug("Retrying task {} ({}), attempt {} failed: {}",
                      task.task_id, tool, result.attempts, result.error->full_message());
        std::this_thread::sleep_for(backoff);
    }

    result.duration = since(started);

    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        auto& slot = batch->slots[index];
        if (slot.phase != Phase::Running) {
            return;
        }
        slot.result = std::move(result);
        slot.phase = Phase::Finished;
        --batch->remaining;
    }
    batch->cv.notify_all();
}

}  // namespace

TaskExecutor::TaskExecutor(const ToolRegistry& registry, WorkerPool& pool, const ExecutorConfig& config)
    : registry_(registry)
    , pool_(pool)
    , config_(config)
{
}

std::vector<TaskResult> TaskExecutor::run(const std::vector<Task>& tasks) {
    if (tasks.empty()) {
        return {};
    }

    const auto batch_start = SteadyClock::now();
    const auto batch_deadline = batch_start + Duration{config_.batch_timeout_ms};

    auto batch = std::make_shared<BatchState>();
    batch->slots.resize(tasks.size());

    // Priority order for dispatch; results stay in input order
    std::vector<size_t> order(tasks.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&tasks](size_t a, size_t b) {
        return tasks[a].priority() > tasks[b].priority();
    });

    std::vector<std::pair<size_t, ToolId>> dispatch;
    dispatch.reserve(tasks.size());

    for (size_t i : order) {
        const auto& task = tasks[i];
        auto& slot = batch->slots[i];
        slot.result.task_id = task.task_id;

        auto tool = task.tool();
        if (!tool) {
            slot.result = failed(task, Error{ErrorCode::ToolNotFound, "Task names no tool", task.task_id});
            slot.phase = Phase::Finished;
            continue;
        }

        auto spec = registry_.get_spec(*tool);
        if (!spec) {
            slot.result = failed(task, Error{ErrorCode::ToolNotFound, "Tool not found", *tool});
            slot.phase = Phase::Finished;
            continue;
        }

        slot.timeout = Duration{spec->timeout_ms > 0 ? spec->timeout_ms : config_.task_timeout_ms};
        dispatch.emplace_back(i, *tool);
    }

    batch->remaining = dispatch.size();

    for (const auto& [index, tool] : dispatch) {
        // Copies: the job may still be running after run() returns
        bool posted = pool_.post(
            [registry = &registry_, config = config_, batch, index = index, task = tasks[index], tool = tool]() {
                run_task(*registry, config, batch, index, task, tool);
            });

        if (!posted) {
            std::lock_guard<std::mutex> lock(batch->mutex);
            auto& slot = batch->slots[index];
            slot.result = failed(tasks[index], Error{ErrorCode::InternalError, "Worker pool is stopped", tool});
            slot.phase = Phase::Finished;
            --batch->remaining;
        }
    }

    {
        std::unique_lock<std::mutex> lock(batch->mutex);
        while (batch->remaining > 0) {
            auto now = SteadyClock::now();

            if (now >= batch_deadline) {
                for (size_t i = 0; i < batch->slots.size(); ++i) {
                    auto& slot = batch->slots[i];
                    if (slot.phase != Phase::Queued && slot.phase != Phase::Running) {
                        continue;
                    }
                    auto ran = slot.phase == Phase::Running
                        ? std::chrono::duration_cast<Duration>(now - slot.started)
                        : Duration{0};
                    slot.result = failed(
                        tasks[i],
                        Error{ErrorCode::BatchTimeout, "Batch deadline passed before the task finished", tasks[i].task_id},
                        ran,
                        slot.phase == Phase::Running ? 1 : 0
                    );
                    slot.phase = Phase::Abandoned;
                }
                batch->remaining = 0;
                break;
            }

            auto wake = batch_deadline;
            for (size_t i = 0; i < batch->slots.size(); ++i) {
                auto& slot = batch->slots[i];
                if (slot.phase != Phase::Running) {
                    continue;
                }
                auto task_deadline = slot.started + slot.timeout;
                if (now >= task_deadline) {
                    slot.result = failed(
                        tasks[i],
                        Error{ErrorCode::ToolTimeout, "Tool call exceeded its timeout", tasks[i].task_id},
                        std::chrono::duration_cast<Duration>(now - slot.started),
                        1
                    );
                    slot.phase = Phase::Abandoned;
                    --batch->remaining;
                } else {
                    wake = std::min(wake, task_deadline);
                }
            }

            if (batch->remaining > 0) {
                batch->cv.wait_until(lock, wake);
            }
        }
    }

    std::vector<TaskResult> results;
    results.reserve(tasks.size());
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        for (auto& slot : batch->slots) {
            results.push_back(slot.result);
        }
    }

    for (const auto& r : results) {
        if (!r.succeeded()) {
            spdlog::warn("Task {} failed after {} attempt(s): {}",
                         r.task_id, r.attempts, r.error ? r.error->full_message() : "unknown error");
        }
    }

    record(results);

    auto completed = std::count_if(results.begin(), results.end(),
                                   [](const TaskResult& r) { return r.succeeded(); });
    spdlog::info("Executed {} task(s): {} done, {} failed in {}ms",
                 results.size(), completed, results.size() - static_cast<size_t>(completed),
                 to_millis(since(batch_start)));

    return results;
}

TaskExecutor::Stats TaskExecutor::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void TaskExecutor::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = Stats{};
}

void TaskExecutor::record(const std::vector<TaskResult>& results) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    for (const auto& r : results) {
        stats_.total_executions++;
        if (r.succeeded()) {
            stats_.successful++;
        } else {
            stats_.failed++;
            if (r.error && (r.error->code == ErrorCode::ToolTimeout ||
                            r.error->code == ErrorCode::BatchTimeout)) {
                stats_.timeouts++;
            }
        }
        if (r.attempts > 1) {
            stats_.retries += r.attempts - 1;
        }
        stats_.total_time += r.duration;
    }
}

}  // namespace waypoint::tools
