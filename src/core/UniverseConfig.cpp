#include "UniverseConfig.h"
#include "LoggingChannels.h"
#include "Universe.h"

#include <charconv>
#include <fstream>
#include <sstream>

namespace Convida {

/**
 * @brief Get default universe config.
 *
 * Kept out of the header so tweaking defaults doesn't ripple through rebuilds.
 */
UniverseConfig getDefaultUniverseConfig()
{
    return UniverseConfig{ .width = Universe::DEFAULT_WIDTH,
                           .height = Universe::DEFAULT_HEIGHT,
                           .seed_pattern = SeedPattern::Random,
                           .random_seed = std::nullopt,
                           .steps = 100,
                           .frame_delay_ms = 100,
                           .gliders = {},
                           .pulsars = {} };
}

Result<UniverseConfig, UniverseError> validateUniverseConfig(const UniverseConfig& config)
{
    if (config.width == 0 || config.height == 0) {
        return Result<UniverseConfig, UniverseError>::error(UniverseError(
            "Universe dimensions must be non-zero, got " + std::to_string(config.width) + "x"
            + std::to_string(config.height)));
    }
    return Result<UniverseConfig, UniverseError>::okay(config);
}

Result<UniverseConfig, UniverseError> parseUniverseConfig(const std::string& text)
{
    UniverseConfig config = getDefaultUniverseConfig();
    try {
        config = nlohmann::json::parse(text).get<UniverseConfig>();
    }
    catch (const nlohmann::json::exception& e) {
        return Result<UniverseConfig, UniverseError>::error(
            UniverseError(std::string("Invalid universe config: ") + e.what()));
    }
    catch (const std::runtime_error& e) {
        return Result<UniverseConfig, UniverseError>::error(
            UniverseError(std::string("Invalid universe config: ") + e.what()));
    }

    return validateUniverseConfig(config);
}

Result<UniverseConfig, UniverseError> loadUniverseConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<UniverseConfig, UniverseError>::error(
            UniverseError("Cannot open universe config: " + path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parseUniverseConfig(buffer.str());
    if (result.isValue()) {
        LoggingChannels::config()->info("Loaded universe config from {}", path);
    }
    else {
        LoggingChannels::config()->error("{}: {}", path, result.errorValue().message);
    }
    return result;
}

Result<PatternAnchor, UniverseError> parsePatternAnchor(const std::string& text)
{
    const size_t comma = text.find(',');
    if (comma == std::string::npos) {
        return Result<PatternAnchor, UniverseError>::error(
            UniverseError("Expected 'row,col', got '" + text + "'"));
    }

    PatternAnchor anchor;
    const char* rowBegin = text.data();
    const char* rowEnd = text.data() + comma;
    const char* colBegin = rowEnd + 1;
    const char* colEnd = text.data() + text.size();

    auto [rowPtr, rowErr] = std::from_chars(rowBegin, rowEnd, anchor.row);
    auto [colPtr, colErr] = std::from_chars(colBegin, colEnd, anchor.col);
    if (rowErr != std::errc() || rowPtr != rowEnd || colErr != std::errc() || colPtr != colEnd) {
        return Result<PatternAnchor, UniverseError>::error(
            UniverseError("Expected 'row,col' with unsigned integers, got '" + text + "'"));
    }

    return Result<PatternAnchor, UniverseError>::okay(anchor);
}

Universe createUniverse(const UniverseConfig& config)
{
    Universe universe = config.random_seed.has_value()
        ? Universe(config.width, config.height, config.seed_pattern, config.random_seed.value())
        : Universe(config.width, config.height, config.seed_pattern);

    for (const auto& anchor : config.gliders) {
        universe.glider(anchor.row, anchor.col);
    }
    for (const auto& anchor : config.pulsars) {
        universe.pulsar(anchor.row, anchor.col);
    }

    return universe;
}

void to_json(nlohmann::json& j, const PatternAnchor& anchor)
{
    j = nlohmann::json::array({ anchor.row, anchor.col });
}

void from_json(const nlohmann::json& j, PatternAnchor& anchor)
{
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("PatternAnchor::from_json: expected [row, col]");
    }
    anchor.row = j.at(0).get<uint32_t>();
    anchor.col = j.at(1).get<uint32_t>();
}

void to_json(nlohmann::json& j, const UniverseConfig& config)
{
    j = nlohmann::json{ { "width", config.width },
                        { "height", config.height },
                        { "seed_pattern", config.seed_pattern },
                        { "steps", config.steps },
                        { "frame_delay_ms", config.frame_delay_ms },
                        { "gliders", config.gliders },
                        { "pulsars", config.pulsars } };

    if (config.random_seed.has_value()) {
        j["random_seed"] = config.random_seed.value();
    }
    else {
        j["random_seed"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, UniverseConfig& config)
{
    if (!j.is_object()) {
        throw std::runtime_error("UniverseConfig::from_json: expected a JSON object");
    }

    config = getDefaultUniverseConfig();

    if (j.contains("width")) config.width = j["width"].get<uint32_t>();
    if (j.contains("height")) config.height = j["height"].get<uint32_t>();
    if (j.contains("seed_pattern")) config.seed_pattern = j["seed_pattern"].get<SeedPattern>();
    if (j.contains("steps")) config.steps = j["steps"].get<uint32_t>();
    if (j.contains("frame_delay_ms")) config.frame_delay_ms = j["frame_delay_ms"].get<uint32_t>();
    if (j.contains("gliders")) config.gliders = j["gliders"].get<std::vector<PatternAnchor>>();
    if (j.contains("pulsars")) config.pulsars = j["pulsars"].get<std::vector<PatternAnchor>>();

    if (j.contains("random_seed")) {
        const auto& seed = j["random_seed"];
        if (seed.is_null()) {
            config.random_seed.reset();
        }
        else {
            config.random_seed = seed.get<uint32_t>();
        }
    }
}

} // namespace Convida
