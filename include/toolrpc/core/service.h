/**
 * @file service.h
 * @brief Base class for daemon services
 */

#pragma once

namespace toolrpc {

/**
 * @brief Abstract base class for long-running daemon services
 *
 * Transports that run in the background (the socket server) implement this
 * so main can start and stop them uniformly.
 */
class Service {
public:
    virtual ~Service() = default;

    /**
     * @brief Start the service
     * @return true if started successfully
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the service; safe to call more than once
     */
    virtual void stop() = 0;

    /**
     * @brief Get service name for logging
     */
    virtual const char* name() const = 0;

    virtual bool is_running() const = 0;

    virtual bool is_healthy() const { return is_running(); }
};

} // namespace toolrpc
