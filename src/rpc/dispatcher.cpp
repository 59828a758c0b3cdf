/**
 * @file dispatcher.cpp
 * @brief Dispatcher implementation
 */

#include "toolrpc/rpc/dispatcher.h"
#include "toolrpc/logger.h"
#include "toolrpc/tools/tool.h"
#include <stdexcept>
#include <system_error>

namespace toolrpc {

namespace {

// Must be called from inside a catch block
RpcError current_failure() {
    try {
        throw;
    } catch (const Error& e) {
        return RpcError::from(e);
    } catch (const std::system_error& e) {
        // Also covers std::filesystem::filesystem_error
        return RpcError::from(from_system_error(e));
    } catch (const std::exception& e) {
        return RpcError::from(ToolError(e.what()));
    }
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<const MethodRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("Dispatcher requires a registry");
    }
}

std::future<std::string> Dispatcher::dispatch(const std::string& wire) const {
    Request request = Request::parse(wire);

    if (request.protocol_version != PROTOCOL_VERSION) {
        return make_ready_future(reject(
            RpcError::invalid_request("Invalid protocol version"), request.id, request.method));
    }

    if (request.method.empty()) {
        return make_ready_future(reject(
            RpcError::invalid_request("Missing method"), request.id, request.method));
    }

    const MethodRegistry::Handler* handler = registry_->find(request.method);
    if (!handler) {
        return make_ready_future(reject(RpcError::method_not_found(), request.id, request.method));
    }

    LOG_DEBUG("Dispatcher", "Dispatching " + request.method + " id=" + request.id.dump());

    std::future<json> pending;
    try {
        pending = (*handler)(request.params);
    } catch (const std::exception&) {
        return make_ready_future(reject(current_failure(), request.id, request.method));
    }

    return std::async(std::launch::deferred, &Dispatcher::complete,
                      std::move(pending), std::move(request.id), std::move(request.method));
}

std::string Dispatcher::call(const std::string& wire) const {
    return dispatch(wire).get();
}

std::string Dispatcher::complete(std::future<json> pending, const json& id, const std::string& method) {
    json result;
    try {
        result = pending.get();
    } catch (const std::exception&) {
        return reject(current_failure(), id, method);
    }

    try {
        return Response::success(std::move(result), id).dump();
    } catch (const json::exception& e) {
        return reject(RpcError::from(ToolError("Failed to encode result: " + std::string(e.what()))), id, method);
    }
}

std::string Dispatcher::reject(const RpcError& error, const json& id, const std::string& method) {
    LOG_WARN("Dispatcher", (method.empty() ? std::string("<none>") : method) +
             " failed (" + std::to_string(error.code) + "): " + error.message);
    return Response::failure(error, id).dump();
}

} // namespace toolrpc
