#pragma once

#include "Cell.h"
#include "Result.h"
#include "UniverseError.h"

#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace Convida {

/**
 * Named generators that fill a fresh cell buffer.
 *
 *   Default - deterministic stripes: index i is alive iff i % 2 == 0 or i % 7 == 0.
 *   Glider  - all dead except one glider at the origin (plain row-major indexing).
 *   Random  - each cell alive with probability 0.5.
 */
enum class SeedPattern : uint8_t {
    Default = 0,
    Glider,
    Random,
};

const char* getSeedPatternName(SeedPattern pattern);

Result<SeedPattern, UniverseError> parseSeedPattern(std::string_view name);

// Comma-separated list of the accepted generator names, for help text.
std::string getSeedPatternNames();

/**
 * Build a buffer of `size` cells laid out in rows of `width`.
 *
 * The glider generator throws std::out_of_range when the buffer cannot hold a
 * glider at the origin.
 */
std::vector<Cell> createCells(SeedPattern pattern, size_t size, size_t width, std::mt19937& rng);

// Throws std::runtime_error for an unknown generator name.
std::vector<Cell> createCells(std::string_view name, size_t size, size_t width, std::mt19937& rng);

void to_json(nlohmann::json& j, SeedPattern pattern);
void from_json(const nlohmann::json& j, SeedPattern& pattern);

} // namespace Convida
