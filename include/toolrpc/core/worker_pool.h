/**
 * @file worker_pool.h
 * @brief Fixed-size thread pool for blocking tool work
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace toolrpc {

/**
 * @brief Runs blocking work (directory walks, file scans, child processes)
 * off the dispatching thread
 *
 * Exceptions thrown by a task are delivered through its future.
 */
class WorkerPool {
public:
    /**
     * @param threads Number of worker threads (at least one is started)
     */
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a callable and return the future of its result
     * @throws std::runtime_error if the pool has been stopped
     */
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_) {
                throw std::runtime_error("WorkerPool is stopped");
            }
            queue_.push([task] { (*task)(); });
        }
        queue_cv_.notify_one();
        return result;
    }

    /**
     * @brief Finish queued work and join all workers (idempotent)
     */
    void stop();

    size_t size() const { return workers_.size(); }
    size_t pending() const;
    bool is_running() const { return running_; }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> running_{true};

    void worker_loop();
};

} // namespace toolrpc
