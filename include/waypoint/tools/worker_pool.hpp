#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace waypoint::tools {

// Fixed-size thread pool. Jobs beyond the worker count wait in a FIFO queue
// until a worker frees up. One pool can be shared by several executors.
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Submit a task and get a future
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // Fire-and-forget; false once the pool is stopped
    bool post(std::function<void()> job);

    // Get number of threads
    size_t size() const { return workers_.size(); }

    // Jobs waiting for a worker
    size_t queued() const;

    // Jobs currently running
    size_t active() const { return active_.load(); }

    // Finish queued jobs, then join the workers
    void shutdown();

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_{0};

    void worker_loop();
};

template<typename F, typename... Args>
auto WorkerPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    if (!post([task]() { (*task)(); })) {
        throw std::runtime_error("WorkerPool is stopped");
    }
    return result;
}

}  // namespace waypoint::tools
