/**
 * @file config.h
 * @brief Configuration management for toolrpcd
 */

#pragma once

#include "toolrpc/common.h"
#include "toolrpc/rpc/transform.h"
#include <string>
#include <optional>
#include <mutex>

namespace toolrpc {

/**
 * @brief Transport the daemon serves requests on
 */
enum class Transport {
    STDIO,
    SOCKET
};

const char* to_string(Transport transport);

/**
 * @brief Daemon configuration structure
 */
struct Config {
    Transport transport = Transport::STDIO;

    // Socket configuration
    std::string socket_path = DEFAULT_SOCKET_PATH;
    int socket_backlog = SOCKET_BACKLOG;
    int socket_timeout_ms = SOCKET_TIMEOUT_MS;
    size_t max_message_bytes = MAX_MESSAGE_SIZE;

    // Wire formats
    FormatConfig format;

    // Blocking tool work
    int workers = DEFAULT_WORKER_THREADS;

    // Logging
    int log_level = 1;  // 0=DEBUG, 1=INFO, 2=WARN, 3=ERROR, 4=CRITICAL

    /**
     * @brief Load configuration from YAML file
     * @param path Path to configuration file
     * @return Config if successful, nullopt on error
     */
    static std::optional<Config> load(const std::string& path);

    /**
     * @brief Parse configuration from YAML text
     */
    static std::optional<Config> parse(const std::string& yaml);

    /**
     * @brief Get default configuration
     */
    static Config defaults();

    /**
     * @brief Expand ~ in all path fields
     */
    void expand_paths();

    /**
     * @brief Validate configuration
     * @return Empty string if valid, error message otherwise
     */
    std::string validate() const;
};

/**
 * @brief Configuration manager singleton
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    /**
     * @brief Load configuration from file
     * @return true if loaded successfully; on failure the previous
     *         configuration (or defaults) stays in effect
     */
    bool load(const std::string& path);

    /**
     * @brief Reload configuration from previously loaded path
     */
    bool reload();

    /**
     * @brief Get current configuration (returns copy for thread safety)
     */
    Config get() const;

    std::string path() const;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

private:
    ConfigManager() = default;

    Config config_;
    std::string config_path_;
    mutable std::mutex mutex_;
};

} // namespace toolrpc
