#pragma once

#include "Cell.h"
#include "SeedPattern.h"
#include "Timers.h"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace Convida {

/**
 * Universe: a toroidal Game of Life grid (rule B3/S23).
 *
 * Cells are stored row-major: cells[row * width + col]. The buffer always
 * holds exactly width * height cells.
 *
 * Two wraparound strategies coexist and are kept distinct:
 * - Neighbor counting wraps each axis independently (north of row 0 is the
 *   last row, west of column 0 is the last column).
 * - Pattern stamping (glider(), pulsar()) wraps the flattened index modulo
 *   width * height, so a pattern running off the right edge continues on the
 *   next row and one running off the bottom continues at the top.
 *
 * Coordinate arguments are (row, col). Out-of-range coordinates throw
 * std::out_of_range; pattern anchors are never range-checked since they wrap.
 */
class Universe {
public:
    static constexpr uint32_t DEFAULT_WIDTH = 128;
    static constexpr uint32_t DEFAULT_HEIGHT = 128;
    static constexpr uint32_t PULSAR_SIZE = 13;

    // DEFAULT_WIDTH x DEFAULT_HEIGHT, randomly seeded.
    Universe();
    Universe(uint32_t width, uint32_t height, SeedPattern pattern = SeedPattern::Random);
    Universe(uint32_t width, uint32_t height, SeedPattern pattern, uint32_t randomSeed);
    ~Universe();

    Universe(const Universe& other) = default;
    Universe& operator=(const Universe& other) = default;
    Universe(Universe&&) = default;
    Universe& operator=(Universe&&) = default;

    // =================================================================
    // SIMULATION
    // =================================================================

    // Advance one generation. A zero-area universe is left untouched.
    void tick();

    // Number of ticks since the grid was last seeded, cleared or resized.
    uint64_t getGeneration() const { return generation_; }

    // =================================================================
    // ACCESS
    // =================================================================

    uint32_t getWidth() const { return width_; }
    uint32_t getHeight() const { return height_; }

    const std::vector<Cell>& getCells() const { return cells_; }

    // Raw buffer for hosts that blit cells straight to pixels.
    const Cell* cellsData() const { return cells_.data(); }

    Cell getCell(uint32_t row, uint32_t col) const;

    // Live cells among the 8 wrapped neighbors of (row, col), in [0, 8].
    uint8_t liveNeighborCount(uint32_t row, uint32_t col) const;

    size_t countAlive() const;

    // One glyph per cell, one line per row.
    std::string render() const;

    // =================================================================
    // SIZING AND SEEDING
    // =================================================================

    /**
     * Change the width. Every cell becomes Dead; existing content is not
     * carried over.
     */
    void setWidth(uint32_t width);

    /**
     * Change the height. Every cell becomes Dead; existing content is not
     * carried over.
     */
    void setHeight(uint32_t height);

    /**
     * Re-dimension and randomly seed. The receiver takes the new size and
     * content, and a copy is returned so callers can replace their handle.
     */
    Universe setSize(uint32_t width, uint32_t height);

    // Randomly re-seed at the current size.
    void reset();

    // Re-seed at the current size with a named generator.
    void reseed(SeedPattern pattern);

    // Every cell Dead.
    void clear();

    // Affects subsequent random seeding only.
    void setRandomSeed(uint32_t seed);

    // =================================================================
    // CELL MUTATION
    // =================================================================

    void toggleCell(uint32_t row, uint32_t col);

    // Mark each (row, col) Alive. All coordinates are validated before any cell changes.
    void setCells(const std::vector<std::pair<uint32_t, uint32_t>>& cells);

    // =================================================================
    // PATTERNS
    // =================================================================

    /**
     * Stamp a glider whose 3x3 bounding box starts at (row, col):
     *
     *   .O.
     *   ..O
     *   OOO
     */
    void glider(uint32_t row, uint32_t col);

    // Stamp the period-3 pulsar whose 13x13 bounding box starts at (row, col).
    void pulsar(uint32_t row, uint32_t col);

    // =================================================================
    // INSTRUMENTATION
    // =================================================================

    Timers& getTimers() { return timers_; }
    const Timers& getTimers() const { return timers_; }

private:
    size_t cellCount() const { return static_cast<size_t>(width_) * height_; }

    size_t getIndex(uint32_t row, uint32_t col) const
    {
        return static_cast<size_t>(row) * width_ + col;
    }

    // Throws std::out_of_range naming the operation.
    size_t checkedIndex(uint32_t row, uint32_t col, const char* operation) const;

    uint8_t countLiveNeighbors(uint32_t row, uint32_t col) const;

    // Throws std::out_of_range when there is no buffer to wrap around.
    size_t stampLimit(const char* operation) const;

    void markPatternRow(const uint32_t* offsets, size_t count, uint64_t rowStart, size_t limit);

    uint32_t width_;
    uint32_t height_;
    std::vector<Cell> cells_;
    uint64_t generation_ = 0;
    std::mt19937 rng_;
    Timers timers_;
};

/**
 * B3/S23 transition for one cell given its live neighbor count.
 */
Cell nextCellState(Cell cell, uint8_t liveNeighbors);

} // namespace Convida
