/**
 * @file error.cpp
 * @brief Error taxonomy implementation
 */

#include "toolrpc/rpc/error.h"
#include <system_error>

namespace toolrpc {

int code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PARSE: return ErrorCodes::PARSE_ERROR;
        case ErrorKind::INVALID_REQUEST: return ErrorCodes::INVALID_REQUEST;
        case ErrorKind::METHOD_NOT_FOUND: return ErrorCodes::METHOD_NOT_FOUND;
        case ErrorKind::INVALID_PARAMS: return ErrorCodes::INVALID_PARAMS;
        case ErrorKind::IO: return ErrorCodes::IO_ERROR;
        case ErrorKind::PERMISSION_DENIED: return ErrorCodes::PERMISSION_DENIED;
        case ErrorKind::INTERNAL: return ErrorCodes::INTERNAL_ERROR;
        default: return ErrorCodes::INTERNAL_ERROR;
    }
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PARSE: return "parse";
        case ErrorKind::INVALID_REQUEST: return "invalid_request";
        case ErrorKind::METHOD_NOT_FOUND: return "method_not_found";
        case ErrorKind::INVALID_PARAMS: return "invalid_params";
        case ErrorKind::IO: return "io";
        case ErrorKind::PERMISSION_DENIED: return "permission_denied";
        case ErrorKind::INTERNAL: return "internal";
        default: return "unknown";
    }
}

Error::Error(ErrorKind kind, const std::string& message, std::optional<json> data)
    : std::runtime_error(message), kind_(kind), data_(std::move(data)) {
}

ParseError::ParseError(const std::string& detail)
    : Error(ErrorKind::PARSE, "Parse error: " + detail) {
}

InvalidParams::InvalidParams(const std::string& detail, std::optional<json> data)
    : Error(ErrorKind::INVALID_PARAMS, "Invalid params: " + detail, std::move(data)) {
}

IoError::IoError(const std::string& detail)
    : Error(ErrorKind::IO, "I/O error: " + detail) {
}

PermissionDenied::PermissionDenied(const std::string& detail)
    : Error(ErrorKind::PERMISSION_DENIED, "Permission denied: " + detail) {
}

ToolError::ToolError(const std::string& message, std::optional<json> data)
    : Error(ErrorKind::INTERNAL, message, std::move(data)) {
}

Error from_system_error(const std::system_error& e) {
    const auto& code = e.code();
    if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted) {
        return PermissionDenied(e.what());
    }
    return IoError(e.what());
}

} // namespace toolrpc
