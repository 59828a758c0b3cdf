/**
 * @file transport.h
 * @brief Message handling shared by the stdio and socket transports
 */

#pragma once

#include "toolrpc/rpc/dispatcher.h"
#include <string>

namespace toolrpc {

/**
 * @brief Answer one wire message with exactly one envelope
 *
 * Unlike Dispatcher::call this never throws for bad input: an unparseable
 * message becomes a -32700 failure with a null id, and a message longer
 * than max_message_bytes becomes a -32600 failure with a null id.
 */
std::string respond(const Dispatcher& dispatcher, const std::string& message, size_t max_message_bytes);

} // namespace toolrpc
