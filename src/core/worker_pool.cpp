/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation
 */

#include "toolrpc/core/worker_pool.h"
#include "toolrpc/logger.h"

namespace toolrpc {

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
    LOG_DEBUG("WorkerPool", "Started " + std::to_string(threads) + " workers");
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    LOG_DEBUG("WorkerPool", "Stopped");
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            // Drain what was queued before stop()
            if (queue_.empty()) {
                return;
            }

            task = std::move(queue_.front());
            queue_.pop();
        }

        task();
    }
}

} // namespace toolrpc
