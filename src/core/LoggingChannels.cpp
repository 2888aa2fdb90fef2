#include "LoggingChannels.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sstream>

namespace Convida {

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

static constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
static constexpr const char* DEFAULT_LOG_FILE = "convida.log";

const std::vector<std::string>& LoggingChannels::channelNames()
{
    static const std::vector<std::string> names = { "universe", "tick", "pattern", "config", "cli" };
    return names;
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel, spdlog::level::level_enum fileLevel)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(DEFAULT_LOG_FILE, true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };
    createChannels(sharedSinks_);
    spdlog::set_pattern(DEFAULT_PATTERN);

    // Per-cell tick tracing is opt-in.
    setChannelLevel("tick", spdlog::level::info);

    initialized_ = true;
    spdlog::info("LoggingChannels initialized successfully");
}

void LoggingChannels::createChannels(const std::vector<spdlog::sink_ptr>& sinks)
{
    for (const auto& name : channelNames()) {
        createLogger(name, sinks, spdlog::level::trace);
    }

    auto default_logger = std::make_shared<spdlog::logger>("default", sinks.begin(), sinks.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);

    spdlog::flush_every(std::chrono::seconds(1));
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(const std::string& channel)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = item.substr(0, colonPos);
        std::string levelStr = item.substr(colonPos + 1);

        channel.erase(channel.find_last_not_of(" \t") + 1);
        levelStr.erase(0, levelStr.find_first_not_of(" \t"));

        auto level = parseLevelString(levelStr);

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (logger) {
        logger->set_level(level);
        spdlog::debug(
            "Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
    }
    else {
        spdlog::warn("Channel '{}' not found, cannot set level", channel);
    }
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    // Re-initialization from tests replaces any previous logger of the same name.
    spdlog::drop(name);

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults", { { "pattern", DEFAULT_PATTERN }, { "flush_interval_s", 1 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", DEFAULT_LOG_FILE },
                { "truncate", true } } } } },
        { "channels",
          { { "cli", "info" },
            { "config", "info" },
            { "pattern", "info" },
            { "tick", "info" },
            { "universe", "info" } } }
    };
}

bool LoggingChannels::initializeFromConfig(const std::string& configPath)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    bool fromFile = false;
    auto config = loadConfigFile(configPath, fromFile);
    applyConfig(config);

    initialized_ = true;
    return fromFile;
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath, bool& fromFile)
{
    namespace fs = std::filesystem;

    fromFile = false;

    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::info("Logging config '{}' not found, using built-in defaults", configPath);
        return defaultConfig();
    }

    std::ifstream configFile(pathToUse);
    if (!configFile.is_open()) {
        spdlog::error("Cannot open logging config {}, using built-in defaults", pathToUse);
        return defaultConfig();
    }

    try {
        nlohmann::json config = nlohmann::json::parse(configFile);
        spdlog::info("Loaded logging config from {}", pathToUse);
        fromFile = true;
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse logging config {}: {}", pathToUse, e.what());
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config)
{
    std::string pattern = DEFAULT_PATTERN;
    int flushIntervalSeconds = 1;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            pattern = defaults.value("pattern", pattern);
            flushIntervalSeconds = defaults.value("flush_interval_s", flushIntervalSeconds);
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Error reading defaults from config: {}, using built-in defaults", e.what());
    }

    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.contains("sinks")) {
            const auto& sinksConfig = config["sinks"];

            if (sinksConfig.contains("console")) {
                const auto& consoleCfg = sinksConfig["console"];
                if (consoleCfg.value("enabled", true)) {
                    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                    console_sink->set_level(parseLevelString(consoleCfg.value("level", "info")));
                    sinks.push_back(console_sink);
                }
            }

            if (sinksConfig.contains("file")) {
                const auto& fileCfg = sinksConfig["file"];
                if (fileCfg.value("enabled", true)) {
                    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                        fileCfg.value("path", DEFAULT_LOG_FILE), fileCfg.value("truncate", true));
                    file_sink->set_level(parseLevelString(fileCfg.value("level", "debug")));
                    sinks.push_back(file_sink);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using console only", e.what());
        sinks = { std::make_shared<spdlog::sinks::stdout_color_sink_mt>() };
    }

    sharedSinks_ = sinks;
    createChannels(sharedSinks_);
    spdlog::set_pattern(pattern);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    spdlog::flush_every(std::chrono::seconds(flushIntervalSeconds));

    spdlog::info("LoggingChannels initialized from config successfully");
}

} // namespace Convida
