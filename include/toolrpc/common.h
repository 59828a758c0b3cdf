/**
 * @file common.h
 * @brief Common types, constants, and utilities for toolrpc
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <nlohmann/json.hpp>

namespace toolrpc {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr const char* NAME = "toolrpcd";

// Envelope protocol
constexpr const char* PROTOCOL_VERSION = "2.0";
constexpr const char* PROTOCOL_VERSION_FIELD = "protocol_version";

// Default paths
constexpr const char* DEFAULT_SOCKET_PATH = "/run/toolrpc/toolrpc.sock";
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/toolrpc/toolrpc.yaml";

// Socket configuration
constexpr int SOCKET_BACKLOG = 16;
constexpr int SOCKET_TIMEOUT_MS = 5000;
constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

// Deepest container nesting accepted in a request, the envelope object included
constexpr int MAX_NESTING_DEPTH = 512;

// Blocking tool work
constexpr int DEFAULT_WORKER_THREADS = 4;

/**
 * @brief Expand ~ to home directory in paths
 */
inline std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

/**
 * @brief Format a UNIX time as ISO 8601 UTC (thread-safe)
 */
inline std::string format_iso(std::time_t when) {
    std::tm tm{};
    if (gmtime_r(&when, &tm) == nullptr) {
        return "";
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

/**
 * @brief Get current timestamp in ISO format (thread-safe)
 */
inline std::string timestamp_iso() {
    return format_iso(Clock::to_time_t(Clock::now()));
}

} // namespace toolrpc
