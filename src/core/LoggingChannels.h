#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace Convida {

/**
 * @brief Named spdlog loggers, one per subsystem.
 *
 * Channels: universe, tick, pattern, config, cli.
 *
 * Library code logs through get() and keeps working before initialize() is
 * called: unknown channels fall back to the spdlog default logger.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared console and file sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug);

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>, then to
     * built-in defaults when neither exists.
     * @return true if a config file was applied, false if built-in defaults were used
     */
    static bool initializeFromConfig(const std::string& configPath = "logging-config.json");

    /**
     * @brief Get a specific channel logger.
     * @return Logger for the channel, or default logger if channel doesn't exist
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "tick:trace" - per-cell transition logging
     *   "*:off,pattern:debug" - only pattern stamping
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    /**
     * @brief Parse a log level string ("trace", "warn", "off", ...) to enum.
     * Unknown strings map to info.
     */
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static const std::vector<std::string>& channelNames();

    static std::shared_ptr<spdlog::logger> universe() { return get("universe"); }
    static std::shared_ptr<spdlog::logger> tick() { return get("tick"); }
    static std::shared_ptr<spdlog::logger> pattern() { return get("pattern"); }
    static std::shared_ptr<spdlog::logger> config() { return get("config"); }
    static std::shared_ptr<spdlog::logger> cli() { return get("cli"); }

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static void createChannels(const std::vector<spdlog::sink_ptr>& sinks);

    static nlohmann::json defaultConfig();

    // Returns the built-in defaults when no file exists or it cannot be parsed.
    static nlohmann::json loadConfigFile(const std::string& configPath, bool& fromFile);

    static void applyConfig(const nlohmann::json& config);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

} // namespace Convida
