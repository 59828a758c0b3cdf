/**
 * @file stdio_server.cpp
 * @brief Stdio transport implementation
 */

#include "toolrpc/server/stdio_server.h"
#include "toolrpc/server/transport.h"
#include "toolrpc/logger.h"
#include <stdexcept>
#include <string>

namespace toolrpc {

StdioServer::StdioServer(std::shared_ptr<const Dispatcher> dispatcher, size_t max_message_bytes)
    : dispatcher_(std::move(dispatcher)), max_message_bytes_(max_message_bytes) {
    if (!dispatcher_) {
        throw std::invalid_argument("StdioServer requires a dispatcher");
    }
}

size_t StdioServer::serve(std::istream& in, std::ostream& out) {
    running_ = true;
    size_t answered = 0;
    std::string line;

    LOG_INFO("StdioServer", "Serving requests on stdio");

    while (running_ && std::getline(in, line)) {
        if (!running_) {
            // stop() arrived while blocked on input
            break;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        out << respond(*dispatcher_, line, max_message_bytes_) << '\n';
        out.flush();
        if (!out) {
            LOG_ERROR("StdioServer", "Output stream closed, stopping");
            break;
        }
        ++answered;
    }

    running_ = false;
    LOG_INFO("StdioServer", "Stdio transport finished after " + std::to_string(answered) + " requests");
    return answered;
}

} // namespace toolrpc
