/**
 * @file config.cpp
 * @brief YAML configuration loading
 */

#include "toolrpc/config.h"
#include "toolrpc/logger.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

namespace toolrpc {

namespace {

Transport transport_from_string(const std::string& s) {
    if (s == "stdio") return Transport::STDIO;
    if (s == "socket") return Transport::SOCKET;
    throw std::invalid_argument("unknown transport: " + s);
}

Config from_yaml(const YAML::Node& root) {
    Config config = Config::defaults();

    if (!root || root.IsNull()) {
        return config;
    }

    if (root["transport"]) {
        config.transport = transport_from_string(root["transport"].as<std::string>());
    }

    if (const YAML::Node socket = root["socket"]) {
        if (socket["path"]) config.socket_path = socket["path"].as<std::string>();
        if (socket["backlog"]) config.socket_backlog = socket["backlog"].as<int>();
        if (socket["timeout_ms"]) config.socket_timeout_ms = socket["timeout_ms"].as<int>();
    }

    if (root["max_message_bytes"]) {
        config.max_message_bytes = root["max_message_bytes"].as<size_t>();
    }

    if (const YAML::Node format = root["format"]) {
        if (format["input"]) config.format.decode = format_from_string(format["input"].as<std::string>());
        if (format["output"]) config.format.encode = format_from_string(format["output"].as<std::string>());
    }

    if (root["workers"]) {
        config.workers = root["workers"].as<int>();
    }

    // Either 0..4 or a level name
    if (const YAML::Node level = root["log_level"]) {
        int numeric = 0;
        if (YAML::convert<int>::decode(level, numeric)) {
            config.log_level = numeric;
        } else if (auto named = Logger::level_from_string(level.as<std::string>())) {
            config.log_level = static_cast<int>(*named);
        } else {
            throw std::invalid_argument("unknown log_level: " + level.as<std::string>());
        }
    }

    return config;
}

} // namespace

const char* to_string(Transport transport) {
    switch (transport) {
        case Transport::STDIO: return "stdio";
        case Transport::SOCKET: return "socket";
        default: return "unknown";
    }
}

std::optional<Config> Config::load(const std::string& path) {
    try {
        std::string expanded = expand_path(path);
        if (!std::filesystem::exists(expanded)) {
            LOG_WARN("Config", "Config file not found: " + expanded);
            return std::nullopt;
        }

        Config config = from_yaml(YAML::LoadFile(expanded));
        config.expand_paths();

        std::string error = config.validate();
        if (!error.empty()) {
            LOG_ERROR("Config", "Invalid configuration in " + expanded + ": " + error);
            return std::nullopt;
        }
        return config;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "Failed to parse " + path + ": " + e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Config", "Invalid value in " + path + ": " + e.what());
        return std::nullopt;
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("Config", "Failed to read " + path + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<Config> Config::parse(const std::string& yaml) {
    try {
        Config config = from_yaml(YAML::Load(yaml));
        config.expand_paths();

        std::string error = config.validate();
        if (!error.empty()) {
            LOG_ERROR("Config", "Invalid configuration: " + error);
            return std::nullopt;
        }
        return config;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "Failed to parse configuration: " + std::string(e.what()));
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Config", "Invalid value: " + std::string(e.what()));
        return std::nullopt;
    }
}

Config Config::defaults() {
    return Config{};
}

void Config::expand_paths() {
    socket_path = expand_path(socket_path);
}

std::string Config::validate() const {
    if (transport == Transport::SOCKET && socket_path.empty()) {
        return "socket.path must be set for the socket transport";
    }
    if (socket_backlog <= 0) {
        return "socket.backlog must be positive";
    }
    if (socket_timeout_ms <= 0) {
        return "socket.timeout_ms must be positive";
    }
    if (max_message_bytes < 1024) {
        return "max_message_bytes must be at least 1024";
    }
    if (workers <= 0) {
        return "workers must be positive";
    }
    if (log_level < 0 || log_level > 4) {
        return "log_level must be between 0 and 4";
    }
    return "";
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::load(const std::string& path) {
    auto loaded = Config::load(path);
    if (!loaded) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = *loaded;
    config_path_ = path;
    LOG_INFO("ConfigManager", "Configuration loaded from " + path);
    return true;
}

bool ConfigManager::reload() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = config_path_;
    }

    if (path.empty()) {
        LOG_WARN("ConfigManager", "No configuration file to reload");
        return false;
    }
    return load(path);
}

Config ConfigManager::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::string ConfigManager::path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

} // namespace toolrpc
