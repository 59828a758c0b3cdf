/**
 * @file utf8.h
 * @brief UTF-8 checks for bytes that end up in JSON strings
 */

#pragma once

#include <string>

namespace toolrpc {

bool is_valid_utf8(const std::string& bytes);

/**
 * @brief Copy of bytes with every invalid sequence replaced by U+FFFD
 */
std::string to_valid_utf8(const std::string& bytes);

} // namespace toolrpc
