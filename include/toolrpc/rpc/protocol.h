/**
 * @file protocol.h
 * @brief Request/response envelopes
 */

#pragma once

#include "toolrpc/common.h"
#include "toolrpc/rpc/error.h"
#include <optional>
#include <string>
#include <variant>

namespace toolrpc {

/**
 * @brief Incoming request envelope
 *
 * The id is opaque and echoed verbatim; params are carried untouched until
 * the method's handler decodes them.
 */
struct Request {
    std::string protocol_version;  // empty when missing or not a string
    std::string method;            // empty when missing or not a string
    json params;                   // null when missing
    json id;                       // null when missing

    /**
     * @brief Parse a request from wire text
     * @throws ParseError when the text is not JSON or not a JSON object
     */
    static Request parse(const std::string& raw);

    /**
     * @brief Serialize back to wire text
     */
    std::string to_json() const;
};

/**
 * @brief Error object carried by a failure envelope
 */
struct RpcError {
    int code = ErrorCodes::INTERNAL_ERROR;
    std::string message;
    std::optional<json> data;

    json to_json() const;

    static RpcError from(const Error& e);
    static RpcError invalid_request(const std::string& detail);
    static RpcError method_not_found();
};

/**
 * @brief Outgoing response envelope: exactly one of result or error
 */
class Response {
public:
    static Response success(json result, json id);
    static Response failure(RpcError error, json id);

    bool is_success() const { return std::holds_alternative<json>(payload_); }
    const json& result() const { return std::get<json>(payload_); }
    const RpcError& error() const { return std::get<RpcError>(payload_); }
    const json& id() const { return id_; }

    json to_json() const;

    /**
     * @brief Serialize to wire text
     *
     * Successes are serialized strictly and throw json::type_error on
     * invalid UTF-8; failures replace invalid bytes so they always serialize.
     */
    std::string dump() const;

private:
    Response(std::variant<json, RpcError> payload, json id);

    std::variant<json, RpcError> payload_;
    json id_;
};

} // namespace toolrpc
