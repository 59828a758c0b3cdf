/**
 * @file tool.h
 * @brief Contract every callable tool satisfies
 */

#pragma once

#include "toolrpc/common.h"
#include <future>
#include <utility>

namespace toolrpc {

/**
 * @brief A named unit of work with typed parameters and a typed result
 *
 * Params must be decodable with nlohmann from_json and Output encodable with
 * to_json. execute() reports failure by storing a toolrpc::Error (or a
 * std::system_error) in the returned future; it must not block the caller,
 * blocking work belongs on a WorkerPool.
 */
template <typename P, typename R>
class Tool {
public:
    using Params = P;
    using Output = R;

    virtual ~Tool() = default;

    /**
     * @brief Stable tool name, also the default method name
     */
    virtual const char* name() const = 0;

    virtual std::future<Output> execute(Params params) const = 0;
};

/**
 * @brief Future that is already satisfied with value
 */
template <typename T>
std::future<T> make_ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

} // namespace toolrpc
