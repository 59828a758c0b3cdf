/**
 * @file logger.h
 * @brief Process-wide logger: journald when running as a service, stderr otherwise
 *
 * stdout is never written: in stdio mode it carries protocol traffic.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace toolrpc {

// syslog(3) priorities; <syslog.h> is not included because its LOG_* macros collide with ours
namespace internal {
    constexpr int SYSLOG_DEBUG = 7;
    constexpr int SYSLOG_INFO = 6;
    constexpr int SYSLOG_WARNING = 4;
    constexpr int SYSLOG_ERR = 3;
    constexpr int SYSLOG_CRIT = 2;
}

// Numeric values match the `log_level` config key
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    CRITICAL = 4
};

class Logger {
public:
    /**
     * @param use_journald false sends every line to stderr as
     *        "<iso time> [LEVEL] component: message"
     */
    static void init(LogLevel min_level = LogLevel::INFO, bool use_journald = true);

    /**
     * @brief Flush and fall back to stderr at INFO
     */
    static void shutdown();

    static void debug(const std::string& component, const std::string& message);
    static void info(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);
    static void critical(const std::string& component, const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

    /**
     * @brief Whether a message at level would be written
     *
     * The LOG_* macros check this first so filtered messages are never built.
     */
    static bool enabled(LogLevel level);

    /**
     * @brief Clamp a numeric config value into DEBUG..CRITICAL
     */
    static LogLevel level_from_int(int value);

    /**
     * @brief Parse a level name ("debug", "info", "warn"/"warning", "error",
     * "critical"), case-insensitively
     */
    static std::optional<LogLevel> level_from_string(const std::string& name);

private:
    static LogLevel min_level_;
    static bool use_journald_;
    static std::mutex mutex_;
    static bool initialized_;

    static void log(LogLevel level, const std::string& component, const std::string& message);
    static void log_to_journald(LogLevel level, const std::string& component, const std::string& message);
    static void log_to_stderr(LogLevel level, const std::string& component, const std::string& message);

    static int level_to_priority(LogLevel level);
    static const char* level_to_string(LogLevel level);
};

#define TOOLRPC_LOG(level, fn, component, message)         \
    do {                                                   \
        if (toolrpc::Logger::enabled(level)) {             \
            toolrpc::Logger::fn(component, message);       \
        }                                                  \
    } while (0)

#define LOG_DEBUG(component, message) TOOLRPC_LOG(toolrpc::LogLevel::DEBUG, debug, component, message)
#define LOG_INFO(component, message) TOOLRPC_LOG(toolrpc::LogLevel::INFO, info, component, message)
#define LOG_WARN(component, message) TOOLRPC_LOG(toolrpc::LogLevel::WARN, warn, component, message)
#define LOG_ERROR(component, message) TOOLRPC_LOG(toolrpc::LogLevel::ERROR, error, component, message)
#define LOG_CRITICAL(component, message) TOOLRPC_LOG(toolrpc::LogLevel::CRITICAL, critical, component, message)

} // namespace toolrpc
