/**
 * @file utf8.cpp
 * @brief UTF-8 validation and lossy conversion on top of nlohmann's serializer
 */

#include "toolrpc/utils/utf8.h"
#include "toolrpc/common.h"

namespace toolrpc {

bool is_valid_utf8(const std::string& bytes) {
    try {
        json(bytes).dump();
        return true;
    } catch (const json::type_error&) {
        return false;
    }
}

std::string to_valid_utf8(const std::string& bytes) {
    if (is_valid_utf8(bytes)) {
        return bytes;
    }
    std::string quoted = json(bytes).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(quoted).get<std::string>();
}

} // namespace toolrpc
