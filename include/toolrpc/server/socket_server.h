/**
 * @file socket_server.h
 * @brief Unix domain socket transport
 */

#pragma once

#include "toolrpc/common.h"
#include "toolrpc/core/service.h"
#include "toolrpc/rpc/dispatcher.h"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace toolrpc {

struct SocketOptions {
    int backlog = SOCKET_BACKLOG;
    int timeout_ms = SOCKET_TIMEOUT_MS;
    size_t max_message_bytes = MAX_MESSAGE_SIZE;
};

/**
 * @brief One request per connection over an AF_UNIX stream socket
 *
 * A client writes one request (terminated by a newline or by shutting down
 * its write side), reads one response line, and the server closes the
 * connection. Each connection is served on its own thread so a slow tool
 * call does not hold up other clients.
 */
class SocketServer : public Service {
public:
    /**
     * @throws std::invalid_argument if dispatcher is null
     */
    SocketServer(const std::string& socket_path, std::shared_ptr<const Dispatcher> dispatcher,
                 SocketOptions options = SocketOptions());
    ~SocketServer() override;

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    bool start() override;
    void stop() override;
    const char* name() const override { return "SocketServer"; }
    bool is_running() const override { return running_; }

    const std::string& socket_path() const { return socket_path_; }

    /**
     * @brief Connections answered since start
     */
    size_t connections_served() const { return connections_served_; }

private:
    std::string socket_path_;
    std::shared_ptr<const Dispatcher> dispatcher_;
    SocketOptions options_;

    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> accept_thread_;

    std::mutex clients_mutex_;
    std::condition_variable clients_done_;
    size_t active_clients_ = 0;
    std::atomic<size_t> connections_served_{0};

    bool create_socket();
    bool setup_permissions();
    void cleanup_socket();
    void accept_connections();
    void handle_client(int client_fd);

    /**
     * @brief Read one request: up to newline, EOF, or the size limit + 1
     */
    bool read_request(int client_fd, std::string& request);
    bool send_all(int client_fd, const std::string& data);
};

} // namespace toolrpc
