/**
 * @file registry.cpp
 * @brief MethodRegistry implementation
 */

#include "toolrpc/rpc/registry.h"
#include "toolrpc/logger.h"
#include <algorithm>
#include <stdexcept>

namespace toolrpc {

MethodRegistry::MethodRegistry(FormatTransformer transformer)
    : transformer_(transformer) {
}

void MethodRegistry::register_handler(const std::string& method, Handler handler) {
    if (method.empty()) {
        throw std::invalid_argument("method name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("cannot register empty handler for method '" + method + "'");
    }

    auto it = handlers_.find(method);
    if (it != handlers_.end()) {
        LOG_DEBUG("Registry", "Replacing handler for " + method);
        it->second = std::move(handler);
        return;
    }
    handlers_.emplace(method, std::move(handler));
}

const MethodRegistry::Handler* MethodRegistry::find(const std::string& method) const {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool MethodRegistry::contains(const std::string& method) const {
    return handlers_.find(method) != handlers_.end();
}

std::vector<std::string> MethodRegistry::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace toolrpc
