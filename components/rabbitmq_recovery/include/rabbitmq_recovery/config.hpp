/**
 * @file config.hpp
 * @brief Configuration loading for connections, channels and logging
 */

#pragma once

#include "rabbitmq_recovery/types.hpp"

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace rabbitmq_recovery {

// spdlog level and pattern applied at startup
struct LoggingConfig {
    std::string level{"info"};
    std::string pattern;
};

struct RecoveryConfig {
    ConnectionConfig connection;
    ChannelConfig channel;
    LoggingConfig logging;
};

/**
 * @brief Configuration utilities
 *
 * Every section and key is optional; anything missing keeps its default.
 */
class Config {
public:
    /**
     * @brief Load the full configuration from a JSON file
     * @param filepath Path to JSON configuration file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static RecoveryConfig loadRecoveryConfig(const std::string& filepath);

    static ConnectionConfig loadConnectionConfig(const std::string& filepath);
    static ChannelConfig loadChannelConfig(const std::string& filepath);

    static RecoveryConfig parseRecoveryConfig(const nlohmann::json& json);

    // Parse the "connection" section of a document
    static ConnectionConfig parseConnectionConfig(const nlohmann::json& json);

    // Parse the "channel" section of a document
    static ChannelConfig parseChannelConfig(const nlohmann::json& json);

    static LoggingConfig parseLoggingConfig(const nlohmann::json& json);

    /**
     * @brief Apply level and pattern to the default spdlog logger
     *
     * An unknown level is reported and leaves the current level in place.
     */
    static void applyLoggingConfig(const LoggingConfig& config);

private:
    /**
     * @brief Load JSON from file
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace rabbitmq_recovery
