/**
 * @file main.cpp
 * @brief toolrpcd entry point
 */

#include <iostream>
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>
#include <optional>
#include <string>
#include <systemd/sd-daemon.h>
#include "toolrpc/common.h"
#include "toolrpc/config.h"
#include "toolrpc/logger.h"
#include "toolrpc/core/worker_pool.h"
#include "toolrpc/server/socket_server.h"
#include "toolrpc/server/stdio_server.h"
#include "toolrpc/tools/default_tools.h"

using namespace toolrpc;

static std::atomic<bool> g_shutdown_requested(false);
static std::atomic<bool> g_reload_requested(false);
static std::atomic<bool> g_stdio_finished(false);

// Signal handler
static void signal_handler(int sig) {
    if (sig == SIGTERM || sig == SIGINT) {
        g_shutdown_requested = true;
    } else if (sig == SIGHUP) {
        g_reload_requested = true;
    }
}

static void setup_signals() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    // Peers that hang up early must not kill the daemon
    signal(SIGPIPE, SIG_IGN);
}

/**
 * @brief Block the handled signals while spawning threads so they inherit
 * the mask and only the main thread receives them
 */
class SignalMask {
public:
    SignalMask() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &set, &previous_);
    }
    ~SignalMask() {
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

private:
    sigset_t previous_;
};

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <path>   Configuration file (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  -s, --stdio           Serve newline-delimited requests on stdin/stdout\n"
              << "  -S, --socket <path>   Serve requests on a Unix socket\n"
              << "  -v, --verbose         Enable debug logging\n"
              << "  -f, --foreground      Log to stderr instead of journald\n"
              << "  -V, --version         Show version and exit\n"
              << "  -h, --help            Show this help and exit\n";
}

struct Options {
    std::string config_path = DEFAULT_CONFIG_PATH;
    std::optional<Transport> transport;
    std::optional<std::string> socket_path;
    bool verbose = false;
    bool foreground = false;
};

// Returns an exit code when the process should exit immediately
static std::optional<int> parse_args(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-V" || arg == "--version") {
            std::cout << NAME << " " << VERSION << std::endl;
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--stdio") {
            options.transport = Transport::STDIO;
        } else if ((arg == "-S" || arg == "--socket") && i + 1 < argc) {
            options.transport = Transport::SOCKET;
            options.socket_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-f" || arg == "--foreground") {
            options.foreground = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }
    return std::nullopt;
}

static void apply_log_level(const Config& config, bool verbose) {
    Logger::set_level(verbose ? LogLevel::DEBUG : Logger::level_from_int(config.log_level));
}

static void reload_config(bool verbose) {
    auto& config_mgr = ConfigManager::instance();
    if (config_mgr.reload()) {
        apply_log_level(config_mgr.get(), verbose);
        LOG_INFO("main", "Configuration reloaded (transport and formats apply on restart)");
    } else {
        LOG_WARN("main", "Configuration reload failed, keeping previous settings");
    }
}

int main(int argc, char* argv[]) {
    Options options;
    if (auto exit_code = parse_args(argc, argv, options)) {
        return *exit_code;
    }

    // stdout carries protocol traffic in stdio mode; logs go to journald or stderr
    Logger::init(options.verbose ? LogLevel::DEBUG : LogLevel::INFO, !options.foreground);
    LOG_INFO("main", std::string(NAME) + " starting - version " + VERSION);

    auto& config_mgr = ConfigManager::instance();
    if (!config_mgr.load(options.config_path)) {
        LOG_WARN("main", "Using default configuration");
    }

    Config config = config_mgr.get();
    if (options.transport) {
        config.transport = *options.transport;
    }
    if (options.socket_path) {
        config.socket_path = expand_path(*options.socket_path);
    }
    apply_log_level(config, options.verbose);

    setup_signals();

    std::shared_ptr<WorkerPool> pool;
    std::shared_ptr<const Dispatcher> dispatcher;
    std::unique_ptr<SocketServer> socket_server;
    std::shared_ptr<StdioServer> stdio_server;
    std::unique_ptr<std::thread> stdio_thread;

    {
        SignalMask mask;

        pool = std::make_shared<WorkerPool>(static_cast<size_t>(config.workers));
        dispatcher = make_dispatcher(config.format, pool);

        if (config.transport == Transport::SOCKET) {
            SocketOptions socket_options;
            socket_options.backlog = config.socket_backlog;
            socket_options.timeout_ms = config.socket_timeout_ms;
            socket_options.max_message_bytes = config.max_message_bytes;

            socket_server = std::make_unique<SocketServer>(config.socket_path, dispatcher, socket_options);
            if (!socket_server->start()) {
                LOG_ERROR("main", "Failed to start socket server");
                pool->stop();
                Logger::shutdown();
                return 1;
            }
        } else {
            stdio_server = std::make_shared<StdioServer>(dispatcher, config.max_message_bytes);
            stdio_thread = std::make_unique<std::thread>([server = stdio_server] {
                server->serve(std::cin, std::cout);
                g_stdio_finished = true;
            });
        }
    }

    LOG_INFO("main", std::string("Serving on ") + to_string(config.transport) +
             " with " + std::to_string(pool->size()) + " workers");

    // Notify systemd that we're ready
    sd_notify(0, "READY=1\nSTATUS=Serving requests");

    // Main event loop
    std::chrono::milliseconds check_interval(100);
    while (!g_shutdown_requested && !g_stdio_finished) {
        std::this_thread::sleep_for(check_interval);

        if (g_reload_requested.exchange(false)) {
            LOG_INFO("main", "Received reload signal");
            reload_config(options.verbose);
        }
    }

    // Graceful shutdown
    LOG_INFO("main", g_stdio_finished ? "Input closed, shutting down" : "Shutting down gracefully");

    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down");

    if (socket_server) {
        socket_server->stop();
    }

    bool reader_detached = false;
    if (stdio_server) {
        stdio_server->stop();
        if (g_stdio_finished) {
            stdio_thread->join();
        } else {
            // Still blocked reading stdin
            stdio_thread->detach();
            reader_detached = true;
        }
    }

    pool->stop();

    LOG_INFO("main", std::string(NAME) + " shutdown complete");
    Logger::shutdown();

    if (reader_detached) {
        // The reader may still wake on a last line; leave before static destructors run under it
        std::cout.flush();
        _exit(0);
    }

    return 0;
}
