/**
 * @file default_tools.h
 * @brief The built-in tool set and dispatcher factories
 */

#pragma once

#include "toolrpc/core/worker_pool.h"
#include "toolrpc/rpc/dispatcher.h"
#include "toolrpc/rpc/registry.h"
#include "toolrpc/rpc/transform.h"
#include <memory>

namespace toolrpc {

/**
 * @brief Built-in method names
 */
namespace Methods {
    constexpr const char* DIRECTORY_LIST = "directory_list";
    constexpr const char* DIRECTORY_MAKE = "directory_make";
    constexpr const char* FILE_READ = "file_read";
    constexpr const char* FILE_WRITE = "file_write";
    constexpr const char* FILE_MOVE = "file_move";
    constexpr const char* FILE_FIND = "file_find";
    constexpr const char* FILE_GREP = "file_grep";
    constexpr const char* SHELL = "shell";
}

/**
 * @brief Register every built-in tool; blocking work goes to pool
 * @throws std::invalid_argument if pool is null
 */
void register_default_tools(MethodRegistry& registry, std::shared_ptr<WorkerPool> pool);

/**
 * @brief Frozen dispatcher with the built-in tools under the given formats
 */
std::unique_ptr<Dispatcher> make_dispatcher(FormatConfig formats, std::shared_ptr<WorkerPool> pool);

inline std::unique_ptr<Dispatcher> make_plain_dispatcher(std::shared_ptr<WorkerPool> pool) {
    return make_dispatcher(FormatConfig::plain(), std::move(pool));
}

inline std::unique_ptr<Dispatcher> make_wrapped_dispatcher(std::shared_ptr<WorkerPool> pool) {
    return make_dispatcher(FormatConfig::wrapped(), std::move(pool));
}

inline std::unique_ptr<Dispatcher> make_plain_to_wrapped_dispatcher(std::shared_ptr<WorkerPool> pool) {
    return make_dispatcher(FormatConfig::plain_to_wrapped(), std::move(pool));
}

inline std::unique_ptr<Dispatcher> make_wrapped_to_plain_dispatcher(std::shared_ptr<WorkerPool> pool) {
    return make_dispatcher(FormatConfig::wrapped_to_plain(), std::move(pool));
}

} // namespace toolrpc
