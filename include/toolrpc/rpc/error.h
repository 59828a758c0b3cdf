/**
 * @file error.h
 * @brief Error taxonomy and reserved error codes
 */

#pragma once

#include "toolrpc/common.h"
#include <optional>
#include <stdexcept>
#include <system_error>
#include <string>

namespace toolrpc {

/**
 * @brief Reserved error codes (fixed for interoperability)
 */
namespace ErrorCodes {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int IO_ERROR = -32000;
    constexpr int PERMISSION_DENIED = -32001;
}

/**
 * @brief Failure kinds, independent of the exception type that carried them
 */
enum class ErrorKind {
    PARSE,
    INVALID_REQUEST,
    METHOD_NOT_FOUND,
    INVALID_PARAMS,
    IO,
    PERMISSION_DENIED,
    INTERNAL
};

int code_for(ErrorKind kind);
const char* to_string(ErrorKind kind);

/**
 * @brief Base of every failure raised by the dispatcher or a tool
 *
 * what() returns the caller-facing message (already prefixed for its kind).
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, std::optional<json> data = std::nullopt);

    ErrorKind kind() const { return kind_; }
    int code() const { return code_for(kind_); }
    const std::optional<json>& data() const { return data_; }

private:
    ErrorKind kind_;
    std::optional<json> data_;
};

/**
 * @brief The wire text was not a JSON object; no id can be recovered
 */
class ParseError : public Error {
public:
    explicit ParseError(const std::string& detail);
};

class InvalidParams : public Error {
public:
    explicit InvalidParams(const std::string& detail, std::optional<json> data = std::nullopt);
};

class IoError : public Error {
public:
    explicit IoError(const std::string& detail);
};

class PermissionDenied : public Error {
public:
    explicit PermissionDenied(const std::string& detail);
};

/**
 * @brief Generic tool-level failure, reported with the message verbatim
 */
class ToolError : public Error {
public:
    explicit ToolError(const std::string& message, std::optional<json> data = std::nullopt);
};

/**
 * @brief Classify a std::system_error (or filesystem_error) raised by a tool
 *
 * permission_denied and operation_not_permitted become PermissionDenied,
 * everything else is an I/O failure.
 */
Error from_system_error(const std::system_error& e);

} // namespace toolrpc
