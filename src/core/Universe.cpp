#include "Universe.h"
#include "LoggingChannels.h"
#include "ScopeTimer.h"
#include "UniverseDiagramGenerator.h"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace Convida {

// Pulsar row classes. Offsets are columns within the 13-cell row segment.
static constexpr std::array<uint32_t, 6> PULSAR_EDGE_OFFSETS = { 2, 3, 4, 8, 9, 10 };
static constexpr std::array<uint32_t, 4> PULSAR_SIDE_OFFSETS = { 0, 5, 7, 12 };

Cell nextCellState(Cell cell, uint8_t liveNeighbors)
{
    if (cell == Cell::Alive) {
        // Underpopulation.
        if (liveNeighbors < 2) return Cell::Dead;
        // Survival.
        if (liveNeighbors == 2 || liveNeighbors == 3) return Cell::Alive;
        // Overpopulation.
        return Cell::Dead;
    }

    // Reproduction.
    if (liveNeighbors == 3) return Cell::Alive;

    return cell;
}

Universe::Universe() : Universe(DEFAULT_WIDTH, DEFAULT_HEIGHT, SeedPattern::Random)
{}

Universe::Universe(uint32_t width, uint32_t height, SeedPattern pattern)
    : width_(width), height_(height), rng_(std::random_device{}())
{
    LoggingChannels::universe()->info(
        "Creating Universe: {}x{} grid, '{}' seed", width_, height_, getSeedPatternName(pattern));
    cells_ = createCells(pattern, cellCount(), width_, rng_);
}

Universe::Universe(uint32_t width, uint32_t height, SeedPattern pattern, uint32_t randomSeed)
    : width_(width), height_(height), rng_(randomSeed)
{
    LoggingChannels::universe()->info(
        "Creating Universe: {}x{} grid, '{}' seed, random seed {}",
        width_,
        height_,
        getSeedPatternName(pattern),
        randomSeed);
    cells_ = createCells(pattern, cellCount(), width_, rng_);
}

Universe::~Universe() = default;

// =================================================================
// SIMULATION
// =================================================================

void Universe::tick()
{
    ScopeTimer tickTimer(timers_, "universe_tick");

    auto logger = LoggingChannels::tick();

    if (width_ == 0 || height_ == 0) {
        logger->debug("Skipping tick on empty {}x{} universe", width_, height_);
        return;
    }

    const bool traceCells = logger->should_log(spdlog::level::trace);

    std::vector<Cell> next;
    {
        ScopeTimer timer(timers_, "allocate_next_cells");
        next = cells_;
    }

    {
        ScopeTimer timer(timers_, "new_generation");
        for (uint32_t row = 0; row < height_; ++row) {
            for (uint32_t col = 0; col < width_; ++col) {
                const size_t idx = getIndex(row, col);
                const Cell cell = cells_[idx];
                const uint8_t liveNeighbors = countLiveNeighbors(row, col);
                const Cell nextCell = nextCellState(cell, liveNeighbors);

                if (traceCells && cell != nextCell) {
                    logger->trace(
                        "Cell ({}, {}) {} -> {} with {} live neighbors",
                        row,
                        col,
                        getCellName(cell),
                        getCellName(nextCell),
                        liveNeighbors);
                }

                next[idx] = nextCell;
            }
        }
    }

    cells_.swap(next);
    ++generation_;

    logger->debug("Generation {} computed", generation_);
}

uint8_t Universe::countLiveNeighbors(uint32_t row, uint32_t col) const
{
    const uint32_t north = row == 0 ? height_ - 1 : row - 1;
    const uint32_t south = row == height_ - 1 ? 0 : row + 1;
    const uint32_t west = col == 0 ? width_ - 1 : col - 1;
    const uint32_t east = col == width_ - 1 ? 0 : col + 1;

    const std::array<size_t, 8> neighbors = {
        getIndex(north, west), getIndex(north, col), getIndex(north, east),
        getIndex(row, west),   getIndex(row, east),  getIndex(south, west),
        getIndex(south, col),  getIndex(south, east),
    };

    uint8_t count = 0;
    for (size_t idx : neighbors) {
        count += static_cast<uint8_t>(cells_[idx]);
    }
    return count;
}

// =================================================================
// ACCESS
// =================================================================

size_t Universe::checkedIndex(uint32_t row, uint32_t col, const char* operation) const
{
    if (row >= height_ || col >= width_) {
        throw std::out_of_range(
            std::string(operation) + ": cell (" + std::to_string(row) + ", " + std::to_string(col)
            + ") is outside the " + std::to_string(width_) + "x" + std::to_string(height_)
            + " universe");
    }
    return getIndex(row, col);
}

Cell Universe::getCell(uint32_t row, uint32_t col) const
{
    return cells_[checkedIndex(row, col, "Universe::getCell")];
}

uint8_t Universe::liveNeighborCount(uint32_t row, uint32_t col) const
{
    checkedIndex(row, col, "Universe::liveNeighborCount");
    return countLiveNeighbors(row, col);
}

size_t Universe::countAlive() const
{
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), Cell::Alive));
}

std::string Universe::render() const
{
    return UniverseDiagramGenerator::generateDiagram(*this);
}

// =================================================================
// SIZING AND SEEDING
// =================================================================

void Universe::setWidth(uint32_t width)
{
    width_ = width;
    cells_.assign(cellCount(), Cell::Dead);
    generation_ = 0;
    LoggingChannels::universe()->info("Width set to {}, all cells cleared", width_);
}

void Universe::setHeight(uint32_t height)
{
    height_ = height;
    cells_.assign(cellCount(), Cell::Dead);
    generation_ = 0;
    LoggingChannels::universe()->info("Height set to {}, all cells cleared", height_);
}

Universe Universe::setSize(uint32_t width, uint32_t height)
{
    LoggingChannels::universe()->info(
        "Resizing universe {}x{} -> {}x{} with random seed", width_, height_, width, height);

    const size_t size = static_cast<size_t>(width) * height;
    cells_ = createCells(SeedPattern::Random, size, width, rng_);
    width_ = width;
    height_ = height;
    generation_ = 0;
    return *this;
}

void Universe::reset()
{
    reseed(SeedPattern::Random);
}

void Universe::reseed(SeedPattern pattern)
{
    cells_ = createCells(pattern, cellCount(), width_, rng_);
    generation_ = 0;
    LoggingChannels::universe()->debug(
        "Re-seeded {}x{} universe with '{}'", width_, height_, getSeedPatternName(pattern));
}

void Universe::clear()
{
    std::fill(cells_.begin(), cells_.end(), Cell::Dead);
    generation_ = 0;
    LoggingChannels::universe()->debug("Cleared {}x{} universe", width_, height_);
}

void Universe::setRandomSeed(uint32_t seed)
{
    rng_.seed(seed);
    LoggingChannels::universe()->debug("Universe RNG seed set to {}", seed);
}

// =================================================================
// CELL MUTATION
// =================================================================

void Universe::toggleCell(uint32_t row, uint32_t col)
{
    toggle(cells_[checkedIndex(row, col, "Universe::toggleCell")]);
}

void Universe::setCells(const std::vector<std::pair<uint32_t, uint32_t>>& cells)
{
    std::vector<size_t> indices;
    indices.reserve(cells.size());
    for (const auto& [row, col] : cells) {
        indices.push_back(checkedIndex(row, col, "Universe::setCells"));
    }

    for (size_t idx : indices) {
        cells_[idx] = Cell::Alive;
    }
}

// =================================================================
// PATTERNS
// =================================================================

size_t Universe::stampLimit(const char* operation) const
{
    const size_t limit = cellCount();
    if (limit == 0) {
        throw std::out_of_range(
            std::string(operation) + ": cannot stamp a pattern on an empty "
            + std::to_string(width_) + "x" + std::to_string(height_) + " universe");
    }
    return limit;
}

void Universe::glider(uint32_t row, uint32_t col)
{
    const size_t limit = stampLimit("Universe::glider");
    const uint64_t width = width_;

    cells_[(1 + col + width * (0 + uint64_t{ row })) % limit] = Cell::Alive;
    cells_[(2 + col + width * (1 + uint64_t{ row })) % limit] = Cell::Alive;
    for (uint64_t i = 0; i < 3; ++i) {
        cells_[(i + col + width * (2 + uint64_t{ row })) % limit] = Cell::Alive;
    }

    LoggingChannels::pattern()->debug("Stamped glider at ({}, {})", row, col);
}

void Universe::pulsar(uint32_t row, uint32_t col)
{
    const size_t limit = stampLimit("Universe::pulsar");

    for (uint32_t patternRow = 0; patternRow < PULSAR_SIZE; ++patternRow) {
        const uint64_t rowStart = (uint64_t{ row } + patternRow) * width_ + col;

        switch (patternRow) {
            case 0:
            case 5:
            case 7:
            case 12:
                markPatternRow(
                    PULSAR_EDGE_OFFSETS.data(), PULSAR_EDGE_OFFSETS.size(), rowStart, limit);
                break;
            case 1:
            case 6:
            case 11:
                // Blank rows.
                break;
            case 2:
            case 3:
            case 4:
            case 8:
            case 9:
            case 10:
                markPatternRow(
                    PULSAR_SIDE_OFFSETS.data(), PULSAR_SIDE_OFFSETS.size(), rowStart, limit);
                break;
            default:
                throw std::logic_error(
                    "Universe::pulsar: invalid pattern row " + std::to_string(patternRow));
        }
    }

    LoggingChannels::pattern()->debug("Stamped pulsar at ({}, {})", row, col);
}

void Universe::markPatternRow(
    const uint32_t* offsets, size_t count, uint64_t rowStart, size_t limit)
{
    for (size_t i = 0; i < count; ++i) {
        cells_[(rowStart + offsets[i]) % limit] = Cell::Alive;
    }
}

} // namespace Convida
