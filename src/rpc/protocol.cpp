/**
 * @file protocol.cpp
 * @brief Envelope implementation
 */

#include "toolrpc/rpc/protocol.h"
#include "toolrpc/logger.h"
#include <utility>

namespace toolrpc {

Request Request::parse(const std::string& raw) {
    json::parser_callback_t limit_depth = [](int depth, json::parse_event_t event, json&) {
        bool opens = event == json::parse_event_t::object_start || event == json::parse_event_t::array_start;
        if (opens && depth >= MAX_NESTING_DEPTH) {
            throw ParseError("request nests deeper than " + std::to_string(MAX_NESTING_DEPTH) + " levels");
        }
        return true;
    };

    json j;
    try {
        j = json::parse(raw, limit_depth);
    } catch (const json::parse_error& e) {
        LOG_WARN("Protocol", "JSON parse error: " + std::string(e.what()));
        throw ParseError(e.what());
    }

    if (!j.is_object()) {
        throw ParseError("request must be a JSON object, got " + std::string(j.type_name()));
    }

    Request req;

    auto version = j.find(PROTOCOL_VERSION_FIELD);
    if (version != j.end() && version->is_string()) {
        req.protocol_version = version->get<std::string>();
    }

    auto method = j.find("method");
    if (method != j.end() && method->is_string()) {
        req.method = method->get<std::string>();
    }

    // Params and id are optional and never interpreted here
    if (j.contains("params")) {
        req.params = j["params"];
    }
    if (j.contains("id")) {
        req.id = j["id"];
    }

    return req;
}

std::string Request::to_json() const {
    json j;
    j[PROTOCOL_VERSION_FIELD] = protocol_version;
    j["method"] = method;
    j["params"] = params;
    j["id"] = id;
    return j.dump();
}

json RpcError::to_json() const {
    json j = {
        {"code", code},
        {"message", message}
    };
    if (data) {
        j["data"] = *data;
    }
    return j;
}

RpcError RpcError::from(const Error& e) {
    RpcError err;
    err.code = e.code();
    err.message = e.what();
    err.data = e.data();
    return err;
}

RpcError RpcError::invalid_request(const std::string& detail) {
    RpcError err;
    err.code = ErrorCodes::INVALID_REQUEST;
    err.message = "Invalid request: " + detail;
    return err;
}

RpcError RpcError::method_not_found() {
    RpcError err;
    err.code = ErrorCodes::METHOD_NOT_FOUND;
    err.message = "Method not found";
    return err;
}

Response::Response(std::variant<json, RpcError> payload, json id)
    : payload_(std::move(payload)), id_(std::move(id)) {
}

Response Response::success(json result, json id) {
    return Response(std::variant<json, RpcError>(std::in_place_type<json>, std::move(result)), std::move(id));
}

Response Response::failure(RpcError error, json id) {
    return Response(std::variant<json, RpcError>(std::in_place_type<RpcError>, std::move(error)), std::move(id));
}

json Response::to_json() const {
    json j;
    j[PROTOCOL_VERSION_FIELD] = PROTOCOL_VERSION;
    if (is_success()) {
        j["result"] = result();
    } else {
        j["error"] = error().to_json();
    }
    j["id"] = id_;
    return j;
}

std::string Response::dump() const {
    if (is_success()) {
        return to_json().dump();
    }
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace toolrpc
