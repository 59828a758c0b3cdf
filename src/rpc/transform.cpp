/**
 * @file transform.cpp
 * @brief Plain <-> wrapped value encoding
 */

#include "toolrpc/rpc/transform.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace toolrpc {

namespace {

constexpr const char* TYPE_KEY = "type";
constexpr const char* TEXT_KEY = "text";
constexpr const char* TEXT_TYPE = "text";

} // namespace

const char* to_string(Format format) {
    switch (format) {
        case Format::PLAIN: return "plain";
        case Format::WRAPPED: return "wrapped";
        default: return "unknown";
    }
}

Format format_from_string(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "plain" || lower == "standard") return Format::PLAIN;
    if (lower == "wrapped" || lower == "bedrock") return Format::WRAPPED;
    throw std::invalid_argument("unknown format: " + s);
}

bool is_wrapper(const json& value) {
    return value.is_object() && value.contains(TYPE_KEY) && value.contains(TEXT_KEY);
}

json wrap(const json& value) {
    if (is_wrapper(value)) {
        return value;
    }

    if (value.is_object()) {
        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = wrap(it.value());
        }
        return out;
    }

    if (value.is_array()) {
        json out = json::array();
        for (const auto& element : value) {
            out.push_back(wrap(element));
        }
        return out;
    }

    return json{{TYPE_KEY, TEXT_TYPE}, {TEXT_KEY, value}};
}

json unwrap(const json& value) {
    if (value.is_object()) {
        auto type = value.find(TYPE_KEY);
        auto text = value.find(TEXT_KEY);
        if (type != value.end() && text != value.end() &&
            type->is_string() && type->get_ref<const std::string&>() == TEXT_TYPE) {
            return unwrap(*text);
        }

        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = unwrap(it.value());
        }
        return out;
    }

    if (value.is_array()) {
        json out = json::array();
        for (const auto& element : value) {
            out.push_back(unwrap(element));
        }
        return out;
    }

    return value;
}

json FormatTransformer::transform_params(const json& params) const {
    if (config_.decode == Format::WRAPPED) {
        return unwrap(params);
    }
    return params;
}

json FormatTransformer::transform_result(const json& result) const {
    if (config_.encode == Format::WRAPPED) {
        return wrap(result);
    }
    return result;
}

} // namespace toolrpc
