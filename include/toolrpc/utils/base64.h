/**
 * @file base64.h
 * @brief Standard (RFC 4648) base64 with padding
 */

#pragma once

#include <optional>
#include <string>

namespace toolrpc {

std::string base64_encode(const std::string& bytes);

/**
 * @brief Decode base64 text; whitespace is ignored
 * @return Decoded bytes, or nullopt if the text is not valid base64
 */
std::optional<std::string> base64_decode(const std::string& text);

} // namespace toolrpc
