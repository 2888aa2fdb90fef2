#pragma once

#include "Result.h"
#include "SeedPattern.h"
#include "UniverseError.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Convida {

class Universe;

// Top-left corner of a stamped pattern. Serialized as [row, col].
struct PatternAnchor {
    uint32_t row = 0;
    uint32_t col = 0;
};

/**
 * @brief Start-up parameters for a Universe and the frame loop driving it.
 *
 * Use getDefaultUniverseConfig() to get default values. Keys missing from a
 * JSON document keep their defaults.
 */
struct UniverseConfig {
    uint32_t width;
    uint32_t height;
    SeedPattern seed_pattern;
    std::optional<uint32_t> random_seed; // Unset: seeded from std::random_device.
    uint32_t steps;                      // Generations the driver runs.
    uint32_t frame_delay_ms;
    std::vector<PatternAnchor> gliders; // Stamped after seeding, in order.
    std::vector<PatternAnchor> pulsars;
};

UniverseConfig getDefaultUniverseConfig();

// Rejects zero dimensions.
Result<UniverseConfig, UniverseError> validateUniverseConfig(const UniverseConfig& config);

Result<UniverseConfig, UniverseError> parseUniverseConfig(const std::string& text);

Result<UniverseConfig, UniverseError> loadUniverseConfig(const std::string& path);

// Parse "row,col".
Result<PatternAnchor, UniverseError> parsePatternAnchor(const std::string& text);

/**
 * Build a universe from a config: size, seed generator, random seed, then
 * gliders followed by pulsars.
 */
Universe createUniverse(const UniverseConfig& config);

void to_json(nlohmann::json& j, const PatternAnchor& anchor);
void from_json(const nlohmann::json& j, PatternAnchor& anchor);

void to_json(nlohmann::json& j, const UniverseConfig& config);
void from_json(const nlohmann::json& j, UniverseConfig& config);

} // namespace Convida
