/**
 * @file blocking_tool.h
 * @brief Tool whose body runs on a WorkerPool
 */

#pragma once

#include "toolrpc/core/worker_pool.h"
#include "toolrpc/tools/tool.h"
#include <memory>
#include <stdexcept>

namespace toolrpc {

/**
 * @brief Base for tools that do blocking filesystem or process work
 *
 * execute() queues run() on the shared pool so a slow call never stalls the
 * dispatching thread. Instances must be owned by a shared_ptr.
 */
template <typename P, typename R>
class BlockingTool : public Tool<P, R>,
                     public std::enable_shared_from_this<BlockingTool<P, R>> {
public:
    explicit BlockingTool(std::shared_ptr<WorkerPool> pool) : pool_(std::move(pool)) {
        if (!pool_) {
            throw std::invalid_argument("BlockingTool requires a worker pool");
        }
    }

    std::future<R> execute(P params) const override {
        auto self = this->shared_from_this();
        return pool_->submit([self, params = std::move(params)]() {
            return self->run(params);
        });
    }

    /**
     * @brief The blocking body, run on a pool thread
     */
    virtual R run(const P& params) const = 0;

protected:
    std::shared_ptr<WorkerPool> pool_;
};

} // namespace toolrpc
