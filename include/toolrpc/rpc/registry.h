/**
 * @file registry.h
 * @brief Method name -> type-erased handler table
 */

#pragma once

#include "toolrpc/common.h"
#include "toolrpc/rpc/error.h"
#include "toolrpc/rpc/transform.h"
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolrpc {

namespace detail {

/**
 * @brief Decode params into a tool's parameter type
 * @throws InvalidParams when the value does not have the expected shape
 */
template <typename P>
P decode_params(const json& value) {
    try {
        return value.get<P>();
    } catch (const json::exception& e) {
        throw InvalidParams(e.what());
    }
}

} // namespace detail

/**
 * @brief Registration-phase table of methods
 *
 * Populate it once, then hand it to a Dispatcher as a shared_ptr<const>;
 * from then on it is only read, so concurrent dispatches need no locking.
 */
class MethodRegistry {
public:
    /**
     * @brief Erased handler: raw params in, future of the encoded result out
     *
     * May throw synchronously (e.g. InvalidParams) before any work starts.
     */
    using Handler = std::function<std::future<json>(const json& params)>;

    explicit MethodRegistry(FormatTransformer transformer = FormatTransformer());

    /**
     * @brief Bind a tool's decode -> execute -> encode sequence under method
     *
     * The closure captures this registry's transformer: params are
     * transformed before decoding and the encoded result is transformed
     * before it is returned. Re-registering a name replaces the old entry.
     *
     * @throws std::invalid_argument if method is empty or tool is null
     */
    template <typename ToolT>
    void register_tool(const std::string& method, std::shared_ptr<ToolT> tool) {
        using Params = typename ToolT::Params;
        using Output = typename ToolT::Output;

        if (!tool) {
            throw std::invalid_argument("cannot register null tool for method '" + method + "'");
        }

        std::shared_ptr<const ToolT> bound = std::move(tool);
        FormatTransformer transformer = transformer_;

        register_handler(method, [bound, transformer](const json& raw) {
            Params params = detail::decode_params<Params>(transformer.transform_params(raw));
            std::future<Output> pending = bound->execute(std::move(params));

            return std::async(std::launch::deferred,
                [transformer](std::future<Output> running) {
                    Output output = running.get();
                    json result;
                    try {
                        result = json(output);
                    } catch (const json::exception& e) {
                        throw ToolError(std::string("Failed to encode result: ") + e.what());
                    }
                    return transformer.transform_result(result);
                },
                std::move(pending));
        });
    }

    /**
     * @brief Register a tool under its own name()
     */
    template <typename ToolT>
    void register_tool(std::shared_ptr<ToolT> tool) {
        if (!tool) {
            throw std::invalid_argument("cannot register null tool");
        }
        std::string method = tool->name();
        register_tool(method, std::move(tool));
    }

    /**
     * @brief Store a raw handler; no format transformation is applied
     * @throws std::invalid_argument if method is empty or handler is empty
     */
    void register_handler(const std::string& method, Handler handler);

    /**
     * @brief Exact-match lookup
     * @return Handler or nullptr
     */
    const Handler* find(const std::string& method) const;

    bool contains(const std::string& method) const;
    size_t size() const { return handlers_.size(); }

    /**
     * @brief Registered method names, sorted
     */
    std::vector<std::string> methods() const;

    const FormatTransformer& transformer() const { return transformer_; }

private:
    FormatTransformer transformer_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace toolrpc
