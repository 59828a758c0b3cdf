/**
 * @file socket_server.cpp
 * @brief Unix socket transport implementation
 */

#include "toolrpc/server/socket_server.h"
#include "toolrpc/server/transport.h"
#include "toolrpc/logger.h"
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace toolrpc {

SocketServer::SocketServer(const std::string& socket_path, std::shared_ptr<const Dispatcher> dispatcher,
                           SocketOptions options)
    : socket_path_(socket_path), dispatcher_(std::move(dispatcher)), options_(options) {
    if (!dispatcher_) {
        throw std::invalid_argument("SocketServer requires a dispatcher");
    }
}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::create_socket() {
    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        LOG_ERROR("SocketServer", "Socket path too long: " + socket_path_);
        return false;
    }

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ == -1) {
        LOG_ERROR("SocketServer", "Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }

    // Remove a stale socket file left by a previous run
    std::error_code ec;
    std::filesystem::remove(socket_path_, ec);

    std::filesystem::path parent = std::filesystem::path(socket_path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        LOG_ERROR("SocketServer", "Failed to bind socket: " + std::string(strerror(errno)));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, options_.backlog) == -1) {
        LOG_ERROR("SocketServer", "Failed to listen: " + std::string(strerror(errno)));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return setup_permissions();
}

bool SocketServer::setup_permissions() {
    // 0666 so unprivileged agent hosts can connect
    if (chmod(socket_path_.c_str(), 0666) == -1) {
        LOG_WARN("SocketServer", "Failed to set socket permissions: " + std::string(strerror(errno)));
    }
    return true;
}

void SocketServer::cleanup_socket() {
    if (server_fd_ != -1) {
        close(server_fd_);
        server_fd_ = -1;
    }
    std::error_code ec;
    std::filesystem::remove(socket_path_, ec);
}

bool SocketServer::start() {
    if (running_) {
        return true;
    }

    if (!create_socket()) {
        return false;
    }

    connections_served_ = 0;
    running_ = true;
    accept_thread_ = std::make_unique<std::thread>([this] { accept_connections(); });
    LOG_INFO("SocketServer", "Socket server started on " + socket_path_);

    return true;
}

void SocketServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    if (server_fd_ != -1) {
        shutdown(server_fd_, SHUT_RDWR);
    }

    if (accept_thread_ && accept_thread_->joinable()) {
        accept_thread_->join();
    }
    accept_thread_.reset();

    // Let connections in flight finish their response
    {
        std::unique_lock<std::mutex> lock(clients_mutex_);
        clients_done_.wait(lock, [this] { return active_clients_ == 0; });
    }

    cleanup_socket();
    LOG_INFO("SocketServer", "Socket server stopped");
}

void SocketServer::accept_connections() {
    LOG_DEBUG("SocketServer", "Accepting connections on " + socket_path_);

    while (running_) {
        int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd == -1) {
            if (!running_ || errno == EBADF || errno == EINVAL) {
                break;
            }
            if (errno != EINTR) {
                LOG_ERROR("SocketServer", "Accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }

        struct timeval timeout;
        timeout.tv_sec = options_.timeout_ms / 1000;
        timeout.tv_usec = (options_.timeout_ms % 1000) * 1000;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            ++active_clients_;
        }

        try {
            std::thread([this, client_fd] { handle_client(client_fd); }).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("SocketServer", "Failed to start client thread: " + std::string(e.what()));
            close(client_fd);
            std::lock_guard<std::mutex> lock(clients_mutex_);
            --active_clients_;
            clients_done_.notify_all();
        }
    }
}

bool SocketServer::read_request(int client_fd, std::string& request) {
    char buffer[4096];

    while (request.size() <= options_.max_message_bytes) {
        ssize_t bytes = recv(client_fd, buffer, sizeof(buffer), 0);
        if (bytes == 0) {
            break;
        }
        if (bytes < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("SocketServer", "Failed to read request: " + std::string(strerror(errno)));
            return false;
        }

        request.append(buffer, static_cast<size_t>(bytes));
        size_t newline = request.find('\n');
        if (newline != std::string::npos) {
            request.resize(newline);
            break;
        }
    }

    if (!request.empty() && request.back() == '\r') {
        request.pop_back();
    }
    return !request.empty();
}

bool SocketServer::send_all(int client_fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(client_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("SocketServer", "Failed to send response: " + std::string(strerror(errno)));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void SocketServer::handle_client(int client_fd) {
    try {
        std::string request;
        if (read_request(client_fd, request)) {
            LOG_DEBUG("SocketServer", "Received " + std::to_string(request.size()) + " bytes");
            std::string response = respond(*dispatcher_, request, options_.max_message_bytes);
            if (send_all(client_fd, response + "\n")) {
                ++connections_served_;
            }
        } else {
            LOG_WARN("SocketServer", "Client disconnected without sending data");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("SocketServer", "Exception handling client: " + std::string(e.what()));
        std::string error_resp = Response::failure(RpcError::from(ToolError(e.what())), nullptr).dump() + "\n";
        send_all(client_fd, error_resp);
    }

    close(client_fd);

    std::lock_guard<std::mutex> lock(clients_mutex_);
    --active_clients_;
    clients_done_.notify_all();
}

} // namespace toolrpc
