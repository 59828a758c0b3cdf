/**
 * @file stdio_server.h
 * @brief Newline-delimited transport over a pair of streams
 */

#pragma once

#include "toolrpc/common.h"
#include "toolrpc/rpc/dispatcher.h"
#include <atomic>
#include <istream>
#include <memory>
#include <ostream>

namespace toolrpc {

/**
 * @brief Reads one request per line, writes one response per line
 *
 * Requests are answered in order. Blank lines are skipped. Output is
 * flushed after every response so a peer on a pipe sees it immediately.
 */
class StdioServer {
public:
    /**
     * @throws std::invalid_argument if dispatcher is null
     */
    explicit StdioServer(std::shared_ptr<const Dispatcher> dispatcher,
                         size_t max_message_bytes = MAX_MESSAGE_SIZE);

    /**
     * @brief Serve until end of input or stop()
     * @return Number of requests answered
     */
    size_t serve(std::istream& in, std::ostream& out);

    /**
     * @brief Stop after the request in flight; takes effect at the next line
     */
    void stop() { running_ = false; }

    bool is_running() const { return running_; }

private:
    std::shared_ptr<const Dispatcher> dispatcher_;
    size_t max_message_bytes_;
    std::atomic<bool> running_{false};
};

} // namespace toolrpc
