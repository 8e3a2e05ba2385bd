#pragma once

#include "waypoint/core/config.hpp"
#include "waypoint/core/result.hpp"
#include "waypoint/state/state_model.hpp"
#include "tool_registry.hpp"
#include "worker_pool.hpp"

#include <mutex>
#include <vector>

namespace waypoint::tools {

using namespace waypoint::core;
using state::Task;
using state::TaskResult;

// Runs a batch of tasks' tool calls on a shared worker pool.
//
// Every input task yields exactly one TaskResult, in input order. A failure,
// exception or timeout in one call only fails that task. Dispatch order is
// metadata.priority descending (stable).
//
// Timeouts do not interrupt a running call: the task is reported failed and
// whatever the call returns later is discarded. Such a call keeps its worker
// busy until it returns, so the registry must outlive the pool's jobs.
class TaskExecutor {
public:
    TaskExecutor(const ToolRegistry& registry, WorkerPool& pool, const ExecutorConfig& config);

    std::vector<TaskResult> run(const std::vector<Task>& tasks);

    // Get execution statistics
    struct Stats {
        int total_executions = 0;
        int successful = 0;
        int failed = 0;
        int timeouts = 0;
        int retries = 0;
        Duration total_time{0};
    };
    Stats get_stats() const;
    void reset_stats();

private:
    const ToolRegistry& registry_;
    WorkerPool& pool_;
    ExecutorConfig config_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    void record(const std::vector<TaskResult>& results);
};

}  // namespace waypoint::tools
