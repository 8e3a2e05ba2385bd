#include "waypoint/tools/worker_pool.hpp"

#include <spdlog/spdlog.h>

namespace waypoint::tools {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    spdlog::debug("Worker pool started with {} threads", num_threads);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> job;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !jobs_.empty();
            });

            if (stop_ && jobs_.empty()) {
                return;
            }

            job = std::move(jobs_.front());
            jobs_.pop();
            ++active_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Worker job threw: {}", e.what());
        } catch (...) {
            spdlog::error("Worker job threw a non-standard exception");
        }
        --active_;
    }
}

bool WorkerPool::post(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return false;
        }
        jobs_.push(std::move(job));
    }

    condition_.notify_one();
    return true;
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

}  // namespace waypoint::tools
