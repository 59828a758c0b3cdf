/**
 * @file transport.cpp
 * @brief Transport-level failure conversion
 */

#include "toolrpc/server/transport.h"
#include "toolrpc/logger.h"

namespace toolrpc {

std::string respond(const Dispatcher& dispatcher, const std::string& message, size_t max_message_bytes) {
    if (message.size() > max_message_bytes) {
        LOG_WARN("Transport", "Rejecting message of " + std::to_string(message.size()) + " bytes");
        return Response::failure(
            RpcError::invalid_request("Message exceeds " + std::to_string(max_message_bytes) + " bytes"),
            nullptr).dump();
    }

    try {
        return dispatcher.call(message);
    } catch (const ParseError& e) {
        return Response::failure(RpcError::from(e), nullptr).dump();
    }
}

} // namespace toolrpc
