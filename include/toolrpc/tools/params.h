/**
 * @file params.h
 * @brief Helpers for decoding tool parameter objects
 *
 * Every helper throws InvalidParams (or lets a json::exception escape,
 * which the registry also reports as invalid params).
 */

#pragma once

#include "toolrpc/common.h"
#include "toolrpc/rpc/error.h"
#include <cstdint>
#include <optional>
#include <string>

namespace toolrpc {

inline void require_object(const json& j) {
    if (!j.is_object()) {
        throw InvalidParams(std::string("expected an object, got ") + j.type_name());
    }
}

template <typename T>
T required_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw InvalidParams(std::string("missing field `") + key + "`");
    }
    return it->get<T>();
}

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template <typename T>
T field_or(const json& j, const char* key, T fallback) {
    auto value = optional_field<T>(j, key);
    return value ? *value : fallback;
}

/**
 * @brief Non-negative integer field (sizes, limits, depths)
 */
inline size_t count_field(const json& j, const char* key, size_t fallback = 0) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<int64_t>() < 0)) {
        throw InvalidParams(std::string("`") + key + "` must be a non-negative integer");
    }
    return it->get<size_t>();
}

} // namespace toolrpc
