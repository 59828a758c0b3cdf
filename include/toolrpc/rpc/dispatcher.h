/**
 * @file dispatcher.h
 * @brief Request dispatch: envelope in, envelope out
 */

#pragma once

#include "toolrpc/rpc/protocol.h"
#include "toolrpc/rpc/registry.h"
#include <future>
#include <memory>
#include <string>

namespace toolrpc {

/**
 * @brief Drives parse -> version check -> lookup -> handler -> envelope
 *
 * Holds the registry frozen (shared_ptr<const>), so any number of dispatch
 * calls may run concurrently. No lock is taken and no timeout is applied;
 * a caller that abandons a future does not cancel the tool.
 */
class Dispatcher {
public:
    /**
     * @throws std::invalid_argument if registry is null
     */
    explicit Dispatcher(std::shared_ptr<const MethodRegistry> registry);

    /**
     * @brief Dispatch one request
     *
     * Every failure after the envelope is parsed (bad version, unknown
     * method, bad params, tool failure, encode failure) becomes a failure
     * envelope carrying the request id. The tool is started before this
     * returns; the deferred future finishes it on the thread that waits.
     *
     * @throws ParseError if the text is not a JSON object
     */
    std::future<std::string> dispatch(const std::string& wire) const;

    /**
     * @brief dispatch() and wait
     */
    std::string call(const std::string& wire) const;

    const MethodRegistry& registry() const { return *registry_; }
    const FormatTransformer& transformer() const { return registry_->transformer(); }

private:
    std::shared_ptr<const MethodRegistry> registry_;

    static std::string complete(std::future<json> pending, const json& id, const std::string& method);
    static std::string reject(const RpcError& error, const json& id, const std::string& method);
};

} // namespace toolrpc
