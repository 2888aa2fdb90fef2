#include "core/Universe.h"

#include <array>
#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace Convida;

namespace {

Universe emptyUniverse(uint32_t width, uint32_t height)
{
    Universe universe(width, height, SeedPattern::Default);
    universe.clear();
    return universe;
}

std::set<size_t> liveIndices(const Universe& universe)
{
    std::set<size_t> result;
    const auto& cells = universe.getCells();
    for (size_t i = 0; i < cells.size(); ++i) {
        if (cells[i] == Cell::Alive) {
            result.insert(i);
        }
    }
    return result;
}

const std::array<std::string, 13> PULSAR_ROWS = {
    "..OOO...OOO..", ".............", "O....O.O....O", "O....O.O....O", "O....O.O....O",
    "..OOO...OOO..", ".............", "..OOO...OOO..", "O....O.O....O", "O....O.O....O",
    "O....O.O....O", ".............", "..OOO...OOO..",
};

} // namespace

TEST(GliderStampTest, MatchesDiagram)
{
    Universe universe = emptyUniverse(8, 8);
    universe.glider(2, 3);

    EXPECT_EQ(universe.countAlive(), 5u);
    EXPECT_EQ(universe.getCell(2, 4), Cell::Alive);
    EXPECT_EQ(universe.getCell(3, 5), Cell::Alive);
    EXPECT_EQ(universe.getCell(4, 3), Cell::Alive);
    EXPECT_EQ(universe.getCell(4, 4), Cell::Alive);
    EXPECT_EQ(universe.getCell(4, 5), Cell::Alive);
}

TEST(GliderStampTest, MatchesGliderSeed)
{
    Universe stamped = emptyUniverse(8, 8);
    stamped.glider(0, 0);

    Universe seeded(8, 8, SeedPattern::Glider);
    EXPECT_EQ(stamped.getCells(), seeded.getCells());
}

TEST(GliderStampTest, OnlyAddsLiveCells)
{
    Universe universe = emptyUniverse(8, 8);
    universe.setCells({ { 7, 7 }, { 2, 4 } });
    universe.glider(2, 3);

    EXPECT_EQ(universe.countAlive(), 6u);
    EXPECT_EQ(universe.getCell(7, 7), Cell::Alive);
}

TEST(GliderStampTest, RightEdgeWrapsOntoNextRow)
{
    // The flattened index wraps, so column 5 of row 0 is column 0 of row 1.
    Universe universe = emptyUniverse(5, 5);
    universe.glider(0, 4);

    EXPECT_EQ(liveIndices(universe), (std::set<size_t>{ 5, 11, 14, 15, 16 }));
    EXPECT_EQ(universe.getCell(1, 0), Cell::Alive);
    EXPECT_EQ(universe.getCell(2, 1), Cell::Alive);
    EXPECT_EQ(universe.getCell(2, 4), Cell::Alive);
    EXPECT_EQ(universe.getCell(3, 0), Cell::Alive);
    EXPECT_EQ(universe.getCell(3, 1), Cell::Alive);
}

TEST(GliderStampTest, BottomRightCornerWrapsToTop)
{
    Universe universe = emptyUniverse(5, 5);
    universe.glider(4, 4);

    EXPECT_EQ(liveIndices(universe), (std::set<size_t>{ 0, 6, 9, 10, 11 }));
}

TEST(GliderStampTest, AnchorsBeyondTheGridWrap)
{
    Universe wrapped = emptyUniverse(6, 6);
    wrapped.glider(7, 1);

    // Row 7 on a 6-row grid is index 7 * 6 + 1 = 43, which is 7 past the end.
    Universe direct = emptyUniverse(6, 6);
    direct.glider(1, 1);

    EXPECT_EQ(wrapped.getCells(), direct.getCells());
}

TEST(GliderStampTest, TinyGridFoldsCellsTogether)
{
    Universe universe = emptyUniverse(2, 2);
    EXPECT_NO_THROW(universe.glider(0, 0));
    EXPECT_GT(universe.countAlive(), 0u);
    EXPECT_EQ(universe.getCells().size(), 4u);
}

TEST(PulsarStampTest, MatchesDiagramAtOrigin)
{
    Universe universe = emptyUniverse(13, 13);
    universe.pulsar(0, 0);

    EXPECT_EQ(universe.countAlive(), 48u);
    for (uint32_t row = 0; row < 13; ++row) {
        for (uint32_t col = 0; col < 13; ++col) {
            const Cell expected = PULSAR_ROWS[row][col] == 'O' ? Cell::Alive : Cell::Dead;
            EXPECT_EQ(universe.getCell(row, col), expected) << "(" << row << ", " << col << ")";
        }
    }
}

TEST(PulsarStampTest, OffsetAnchorLeavesRestDead)
{
    const uint32_t row0 = 3;
    const uint32_t col0 = 5;
    Universe universe = emptyUniverse(24, 20);
    universe.pulsar(row0, col0);

    EXPECT_EQ(universe.countAlive(), 48u);
    for (uint32_t row = 0; row < universe.getHeight(); ++row) {
        for (uint32_t col = 0; col < universe.getWidth(); ++col) {
            const bool inBox = row >= row0 && row < row0 + 13 && col >= col0 && col < col0 + 13;
            const bool expectAlive = inBox && PULSAR_ROWS[row - row0][col - col0] == 'O';
            EXPECT_EQ(universe.getCell(row, col), expectAlive ? Cell::Alive : Cell::Dead)
                << "(" << row << ", " << col << ")";
        }
    }
}

TEST(PulsarStampTest, WrapsFlattenedIndex)
{
    Universe universe = emptyUniverse(20, 20);
    universe.pulsar(10, 10);

    EXPECT_EQ(universe.countAlive(), 48u);
    // Pattern row 0, offsets 8 and 9 fit in row 10.
    EXPECT_EQ(universe.getCell(10, 18), Cell::Alive);
    EXPECT_EQ(universe.getCell(10, 19), Cell::Alive);
    // Offset 10 runs off the right edge onto the next row.
    EXPECT_EQ(universe.getCell(11, 0), Cell::Alive);
    // Pattern row 12 is grid row 22, which wraps to the top: 452 % 400 = 52.
    EXPECT_EQ(universe.getCell(2, 12), Cell::Alive);
}

TEST(PulsarStampTest, HasPeriodThree)
{
    Universe universe = emptyUniverse(17, 17);
    universe.pulsar(2, 2);
    const auto start = universe.getCells();

    universe.tick();
    EXPECT_NE(universe.getCells(), start);
    universe.tick();
    EXPECT_NE(universe.getCells(), start);
    universe.tick();
    EXPECT_EQ(universe.getCells(), start);
}

TEST(PulsarStampTest, StampingTwiceIsIdempotent)
{
    Universe universe = emptyUniverse(16, 16);
    universe.pulsar(1, 1);
    const auto once = universe.getCells();

    universe.pulsar(1, 1);
    EXPECT_EQ(universe.getCells(), once);
}
