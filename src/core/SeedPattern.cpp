#include "SeedPattern.h"
#include "LoggingChannels.h"

#include <array>
#include <stdexcept>

namespace Convida {

static constexpr std::array<const char*, 3> SEED_PATTERN_NAMES = { "default", "glider", "random" };

namespace {

std::vector<Cell> createDefaultCells(size_t size)
{
    std::vector<Cell> cells(size, Cell::Dead);
    for (size_t i = 0; i < size; ++i) {
        if (i % 2 == 0 || i % 7 == 0) {
            cells[i] = Cell::Alive;
        }
    }
    return cells;
}

std::vector<Cell> createGliderCells(size_t size, size_t width)
{
    std::vector<Cell> cells(size, Cell::Dead);

    // Highest index written is the last cell of the third row.
    if (size <= 2 * width + 2) {
        throw std::out_of_range(
            "Glider seed needs more than " + std::to_string(2 * width + 2) + " cells, got "
            + std::to_string(size));
    }

    cells[1] = Cell::Alive;
    cells[2 + width] = Cell::Alive;
    for (size_t i = 0; i < 3; ++i) {
        cells[i + 2 * width] = Cell::Alive;
    }
    return cells;
}

std::vector<Cell> createRandomCells(size_t size, std::mt19937& rng)
{
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::vector<Cell> cells;
    cells.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        cells.push_back(uniform(rng) < 0.5 ? Cell::Alive : Cell::Dead);
    }
    return cells;
}

} // namespace

const char* getSeedPatternName(SeedPattern pattern)
{
    return SEED_PATTERN_NAMES[static_cast<size_t>(pattern)];
}

Result<SeedPattern, UniverseError> parseSeedPattern(std::string_view name)
{
    for (size_t i = 0; i < SEED_PATTERN_NAMES.size(); ++i) {
        if (name == SEED_PATTERN_NAMES[i]) {
            return Result<SeedPattern, UniverseError>::okay(static_cast<SeedPattern>(i));
        }
    }
    return Result<SeedPattern, UniverseError>::error(UniverseError(
        "Unknown seed pattern '" + std::string(name) + "' (expected one of: "
        + getSeedPatternNames() + ")"));
}

std::string getSeedPatternNames()
{
    std::string names;
    for (const char* name : SEED_PATTERN_NAMES) {
        if (!names.empty()) {
            names += ", ";
        }
        names += name;
    }
    return names;
}

std::vector<Cell> createCells(SeedPattern pattern, size_t size, size_t width, std::mt19937& rng)
{
    LoggingChannels::universe()->debug(
        "Seeding {} cells (width {}) with '{}' generator", size, width, getSeedPatternName(pattern));

    switch (pattern) {
        case SeedPattern::Default:
            return createDefaultCells(size);
        case SeedPattern::Glider:
            return createGliderCells(size, width);
        case SeedPattern::Random:
            return createRandomCells(size, rng);
    }

    throw std::logic_error("createCells: unhandled SeedPattern value");
}

std::vector<Cell> createCells(std::string_view name, size_t size, size_t width, std::mt19937& rng)
{
    auto parsed = parseSeedPattern(name);
    if (parsed.isError()) {
        LoggingChannels::universe()->error("{}", parsed.errorValue().message);
        throw std::runtime_error(parsed.errorValue().message);
    }
    return createCells(parsed.value(), size, width, rng);
}

void to_json(nlohmann::json& j, SeedPattern pattern)
{
    j = getSeedPatternName(pattern);
}

void from_json(const nlohmann::json& j, SeedPattern& pattern)
{
    if (!j.is_string()) {
        throw std::runtime_error("SeedPattern::from_json: JSON value must be a string");
    }

    auto parsed = parseSeedPattern(j.get<std::string>());
    if (parsed.isError()) {
        throw std::runtime_error("SeedPattern::from_json: " + parsed.errorValue().message);
    }
    pattern = parsed.value();
}

} // namespace Convida
