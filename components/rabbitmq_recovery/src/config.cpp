/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "rabbitmq_recovery/config.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rabbitmq_recovery {

RecoveryConfig Config::loadRecoveryConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseRecoveryConfig(json);
}

ConnectionConfig Config::loadConnectionConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseConnectionConfig(json);
}

ChannelConfig Config::loadChannelConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseChannelConfig(json);
}

RecoveryConfig Config::parseRecoveryConfig(const nlohmann::json& json) {
    RecoveryConfig config;
    config.connection = parseConnectionConfig(json);
    config.channel = parseChannelConfig(json);
    config.logging = parseLoggingConfig(json);
    return config;
}

ConnectionConfig Config::parseConnectionConfig(const nlohmann::json& json) {
    ConnectionConfig config;

    if (json.contains("connection")) {
        const auto& connectionJson = json["connection"];

        if (connectionJson.contains("host")) {
            config.host = connectionJson["host"].get<std::string>();
        }

        if (connectionJson.contains("port")) {
            config.port = connectionJson["port"].get<int>();
        }

        if (connectionJson.contains("vhost")) {
            config.vhost = connectionJson["vhost"].get<std::string>();
        }

        if (connectionJson.contains("username")) {
            config.username = connectionJson["username"].get<std::string>();
        }

        if (connectionJson.contains("password")) {
            config.password = connectionJson["password"].get<std::string>();
        }

        if (connectionJson.contains("heartbeat")) {
            config.heartbeat = std::chrono::seconds(connectionJson["heartbeat"].get<int>());
        }

        if (connectionJson.contains("frameMax")) {
            config.frameMax = connectionJson["frameMax"].get<uint32_t>();
        }

        if (connectionJson.contains("channelMax")) {
            config.channelMax = connectionJson["channelMax"].get<uint16_t>();
        }

        if (connectionJson.contains("connectionTimeout")) {
            config.connectionTimeout = std::chrono::milliseconds(connectionJson["connectionTimeout"].get<int64_t>());
        }
    }

    return config;
}

ChannelConfig Config::parseChannelConfig(const nlohmann::json& json) {
    ChannelConfig config;

    if (json.contains("channel")) {
        const auto& channelJson = json["channel"];

        if (channelJson.contains("prefetchCount")) {
            config.prefetchCount = channelJson["prefetchCount"].get<uint16_t>();
        }

        if (channelJson.contains("prefetchSize")) {
            config.prefetchSize = channelJson["prefetchSize"].get<uint32_t>();
        }

        // 0 or absent waits indefinitely
        if (channelJson.contains("openTimeout")) {
            auto timeoutMs = channelJson["openTimeout"].get<int64_t>();
            if (timeoutMs > 0) {
                config.openTimeout = std::chrono::milliseconds(timeoutMs);
            }
        }
    }

    return config;
}

LoggingConfig Config::parseLoggingConfig(const nlohmann::json& json) {
    LoggingConfig config;

    if (json.contains("logging")) {
        const auto& loggingJson = json["logging"];

        if (loggingJson.contains("level")) {
            config.level = loggingJson["level"].get<std::string>();
        }

        if (loggingJson.contains("pattern")) {
            config.pattern = loggingJson["pattern"].get<std::string>();
        }
    }

    return config;
}

void Config::applyLoggingConfig(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.level);
    // from_str falls back to off for names it does not know
    if (level == spdlog::level::off && config.level != "off") {
        spdlog::warn("Unknown log level '{}', keeping {}", config.level,
                     spdlog::level::to_string_view(spdlog::get_level()));
    } else {
        spdlog::set_level(level);
    }

    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }
}

nlohmann::json Config::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse configuration file: " + std::string(e.what()));
    }
}

} // namespace rabbitmq_recovery
